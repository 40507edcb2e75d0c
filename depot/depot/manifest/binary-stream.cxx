#include <depot/manifest/binary-stream.hxx>

using namespace std;

namespace depot
{
  static void
  append_utf8 (string& s, uint32_t c)
  {
    if (c < 0x80)
      s += static_cast<char> (c);
    else if (c < 0x800)
    {
      s += static_cast<char> (0xC0 | (c >> 6));
      s += static_cast<char> (0x80 | (c & 0x3F));
    }
    else if (c < 0x10000)
    {
      s += static_cast<char> (0xE0 | (c >> 12));
      s += static_cast<char> (0x80 | ((c >> 6) & 0x3F));
      s += static_cast<char> (0x80 | (c & 0x3F));
    }
    else
    {
      s += static_cast<char> (0xF0 | (c >> 18));
      s += static_cast<char> (0x80 | ((c >> 12) & 0x3F));
      s += static_cast<char> (0x80 | ((c >> 6) & 0x3F));
      s += static_cast<char> (0x80 | (c & 0x3F));
    }
  }

  // Decode UTF-8 into UTF-16 code units. Malformed sequences become U+FFFD
  // rather than an error: a manifest we wrote ourselves never has them and
  // for names coming from elsewhere a replacement is more useful than a
  // failure.
  //
  static vector<uint16_t>
  to_utf16 (const string& s)
  {
    vector<uint16_t> r;
    r.reserve (s.size ());

    for (size_t i (0); i < s.size (); )
    {
      unsigned char b (static_cast<unsigned char> (s[i]));
      uint32_t c;
      size_t n;

      if (b < 0x80)              {c = b;        n = 1;}
      else if ((b & 0xE0) == 0xC0) {c = b & 0x1F; n = 2;}
      else if ((b & 0xF0) == 0xE0) {c = b & 0x0F; n = 3;}
      else if ((b & 0xF8) == 0xF0) {c = b & 0x07; n = 4;}
      else                       {c = 0xFFFD;   n = 1;}

      if (i + n > s.size ())
      {
        c = 0xFFFD;
        n = s.size () - i;
      }
      else
      {
        for (size_t j (1); j < n; ++j)
          c = (c << 6) | (static_cast<unsigned char> (s[i + j]) & 0x3F);
      }

      i += n;

      if (c >= 0x10000)
      {
        c -= 0x10000;
        r.push_back (static_cast<uint16_t> (0xD800 | (c >> 10)));
        r.push_back (static_cast<uint16_t> (0xDC00 | (c & 0x3FF)));
      }
      else
        r.push_back (static_cast<uint16_t> (c));
    }

    return r;
  }

  string binary_reader::
  read_fstring (const char* what)
  {
    int32_t n (read<int32_t> (what));
    string r;

    if (n == 0)
      return r;

    if (n > 0)
    {
      const uint8_t* p (take (static_cast<size_t> (n), what));
      r.assign (reinterpret_cast<const char*> (p), static_cast<size_t> (n));
    }
    else
    {
      // Guard against INT32_MIN before negating.
      //
      if (n < -(1 << 24))
        throw runtime_error (string ("oversized ") + what);

      size_t units (static_cast<size_t> (-n));
      const uint8_t* p (take (units * 2, what));

      for (size_t i (0); i < units; ++i)
      {
        uint32_t c (p[i * 2] | p[i * 2 + 1] << 8);

        if (c >= 0xD800 && c < 0xDC00 && i + 1 < units)
        {
          uint32_t l (p[i * 2 + 2] | p[i * 2 + 3] << 8);
          if (l >= 0xDC00 && l < 0xE000)
          {
            c = 0x10000 + ((c - 0xD800) << 10) + (l - 0xDC00);
            ++i;
          }
        }

        append_utf8 (r, c);
      }
    }

    while (!r.empty () && r.back () == '\0')
      r.pop_back ();

    return r;
  }

  void binary_writer::
  write_fstring (const string& s)
  {
    if (s.empty ())
    {
      write<int32_t> (0);
      return;
    }

    bool ascii (true);
    for (char c: s)
    {
      if (static_cast<unsigned char> (c) >= 0x80)
      {
        ascii = false;
        break;
      }
    }

    if (ascii)
    {
      write<int32_t> (static_cast<int32_t> (s.size () + 1));
      write_bytes (reinterpret_cast<const uint8_t*> (s.data ()), s.size ());
      write<uint8_t> (0);
    }
    else
    {
      vector<uint16_t> u (to_utf16 (s));
      write<int32_t> (-static_cast<int32_t> (u.size () + 1));

      for (uint16_t c: u)
        write<uint16_t> (c);

      write<uint16_t> (0);
    }
  }
}
