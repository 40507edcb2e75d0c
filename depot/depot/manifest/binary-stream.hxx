#pragma once

#include <array>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <stdexcept>

namespace depot
{
  // Little-endian cursor over a byte range.
  //
  // Every read is bounds-checked and throws std::runtime_error naming what
  // was being read, which ends up in the decoder's error message.
  //
  class binary_reader
  {
  public:
    binary_reader (const std::uint8_t* d, std::size_t n)
      : data_ (d), size_ (n) {}

    explicit
    binary_reader (const std::vector<std::uint8_t>& v)
      : data_ (v.data ()), size_ (v.size ()) {}

    std::size_t
    position () const noexcept
    {
      return pos_;
    }

    std::size_t
    size () const noexcept
    {
      return size_;
    }

    std::size_t
    remaining () const noexcept
    {
      return size_ - pos_;
    }

    bool
    eof () const noexcept
    {
      return pos_ == size_;
    }

    void
    seek (std::size_t p, const char* what)
    {
      if (p > size_)
        throw std::runtime_error (std::string ("truncated ") + what);

      pos_ = p;
    }

    template <typename T>
    T
    read (const char* what)
    {
      T r (0);
      const std::uint8_t* p (take (sizeof (T), what));

      for (std::size_t i (0); i != sizeof (T); ++i)
        r |= static_cast<T> (static_cast<T> (p[i]) << (8 * i));

      return r;
    }

    template <std::size_t N>
    std::array<std::uint8_t, N>
    read_bytes (const char* what)
    {
      std::array<std::uint8_t, N> r;
      std::memcpy (r.data (), take (N, what), N);
      return r;
    }

    const std::uint8_t*
    take (std::size_t n, const char* what)
    {
      if (n > remaining ())
        throw std::runtime_error (std::string ("truncated ") + what);

      const std::uint8_t* r (data_ + pos_);
      pos_ += n;
      return r;
    }

    // Length-prefixed string. A negative length means that many UTF-16
    // code units follow, otherwise that many bytes. Either way the count
    // includes a terminating NUL which we strip.
    //
    std::string
    read_fstring (const char* what);

  private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
  };

  class binary_writer
  {
  public:
    std::vector<std::uint8_t>&
    data () noexcept
    {
      return data_;
    }

    std::size_t
    position () const noexcept
    {
      return data_.size ();
    }

    template <typename T>
    void
    write (T v)
    {
      for (std::size_t i (0); i != sizeof (T); ++i)
        data_.push_back (static_cast<std::uint8_t> (
          static_cast<std::uint64_t> (v) >> (8 * i)));
    }

    template <std::size_t N>
    void
    write_bytes (const std::array<std::uint8_t, N>& a)
    {
      data_.insert (data_.end (), a.begin (), a.end ());
    }

    void
    write_bytes (const std::uint8_t* d, std::size_t n)
    {
      data_.insert (data_.end (), d, d + n);
    }

    // Plain ASCII is written as bytes, anything else as UTF-16.
    //
    void
    write_fstring (const std::string&);

    // Overwrite a previously written 32-bit value (section sizes).
    //
    void
    patch (std::size_t at, std::uint32_t v)
    {
      for (std::size_t i (0); i != 4; ++i)
        data_[at + i] = static_cast<std::uint8_t> (v >> (8 * i));
    }

  private:
    std::vector<std::uint8_t> data_;
  };
}
