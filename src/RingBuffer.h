#pragma once

#include <cstddef>
#include <vector>

// Fixed-capacity FIFO. Index 0 is the oldest retained element; pushing into a
// full buffer overwrites the oldest.
template <typename T>
class RingBuffer {
public:
  explicit RingBuffer(size_t capacity = 1)
    : _buf(capacity > 0 ? capacity : 1) {}

  void push(const T& v) {
    _buf[_head] = v;
    _head = (_head + 1) % _buf.size();
    if (_count < _buf.size()) _count++;
  }

  void clear() {
    _head = 0;
    _count = 0;
  }

  size_t size() const { return _count; }
  size_t capacity() const { return _buf.size(); }
  bool empty() const { return _count == 0; }
  bool full() const { return _count == _buf.size(); }

  const T& operator[](size_t i) const { return _buf[physical(i)]; }
  T& operator[](size_t i) { return _buf[physical(i)]; }

  const T& front() const { return (*this)[0]; }
  const T& back() const { return (*this)[_count - 1]; }

  // Last n elements (or fewer), oldest first.
  std::vector<T> tail(size_t n) const {
    if (n > _count) n = _count;
    std::vector<T> out;
    out.reserve(n);
    for (size_t i = _count - n; i < _count; i++) out.push_back((*this)[i]);
    return out;
  }

  std::vector<T> toVector() const { return tail(_count); }

private:
  size_t physical(size_t i) const {
    const size_t start = (_head + _buf.size() - _count) % _buf.size();
    return (start + i) % _buf.size();
  }

  std::vector<T> _buf;
  size_t _head = 0;
  size_t _count = 0;
};
