#include "vgc_driver/transport.hpp"
#include "vgc_driver/errors.hpp"

#include <algorithm>

namespace vgc_driver
{

void ReceiveBuffer::push(const char * data, size_t n)
{
  {
    std::lock_guard<std::mutex> lk(mutex_);
    data_.append(data, n);
  }
  cv_.notify_all();
}

void ReceiveBuffer::set_eof()
{
  {
    std::lock_guard<std::mutex> lk(mutex_);
    eof_ = true;
  }
  cv_.notify_all();
}

void ReceiveBuffer::set_error(const std::string & what)
{
  {
    std::lock_guard<std::mutex> lk(mutex_);
    error_ = what;
  }
  cv_.notify_all();
}

void ReceiveBuffer::reset()
{
  std::lock_guard<std::mutex> lk(mutex_);
  data_.clear();
  eof_ = false;
  error_.clear();
}

void ReceiveBuffer::discard()
{
  std::lock_guard<std::mutex> lk(mutex_);
  data_.clear();
}

std::string ReceiveBuffer::pop(size_t max_bytes, std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lk(mutex_);
  const bool ready = cv_.wait_for(lk, timeout, [this]{
    return !data_.empty() || eof_ || !error_.empty();
  });
  if (!ready) {
    throw Timeout("no data within " + std::to_string(timeout.count()) + " ms");
  }
  // Drain buffered bytes before reporting what ended the stream.
  if (!data_.empty()) {
    const size_t n = std::min(max_bytes, data_.size());
    std::string out = data_.substr(0, n);
    data_.erase(0, n);
    return out;
  }
  if (!error_.empty()) throw ConnectionFault(error_);
  return std::string();
}

} // namespace vgc_driver
