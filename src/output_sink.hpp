#pragma once
/*
 * OutputSink
 *
 * Purpose: destination for rendered bytes (stdout fd, or memory in tests).
 * Constraint: writes are best-effort; a closed pipe must not abort teardown.
 */
#include <cstddef>
#include <string>
#include <string_view>

class OutputSink {
public:
  virtual ~OutputSink() = default;
  // Returns bytes actually written.
  virtual std::size_t write(std::string_view bytes) = 0;
  virtual void flush() {}
};

class FdSink : public OutputSink {
public:
  explicit FdSink(int fd) : fd_(fd) {}
  std::size_t write(std::string_view bytes) override;
  bool broken() const { return broken_; }
private:
  int fd_;
  bool broken_ = false;
};

// In-memory sink used for tests and benchmarks.
class StringSink : public OutputSink {
public:
  std::size_t write(std::string_view bytes) override { data_.append(bytes); writes_++; return bytes.size(); }
  const std::string& data() const { return data_; }
  std::size_t writes() const { return writes_; }
  std::string take() { std::string s; s.swap(data_); return s; }
  void clear() { data_.clear(); writes_ = 0; }
private:
  std::string data_;
  std::size_t writes_ = 0;
};
