#include <depot/manifest/manifest-types.hxx>

#include <cstdio>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <stdexcept>

#include <openssl/evp.h>

using namespace std;

namespace depot
{
  static int
  hex_value (char c)
  {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  string guid::
  string () const
  {
    char b[33];
    snprintf (b, sizeof (b), "%08X%08X%08X%08X",
              words[0], words[1], words[2], words[3]);
    return std::string (b, 32);
  }

  guid guid::
  parse (const std::string& s)
  {
    if (s.size () != 32)
      throw invalid_argument ("invalid GUID '" + s + "': expected 32 digits");

    guid g;
    for (size_t i (0); i != 4; ++i)
    {
      uint32_t w (0);
      for (size_t j (0); j != 8; ++j)
      {
        int v (hex_value (s[i * 8 + j]));
        if (v < 0)
          throw invalid_argument ("invalid GUID '" + s + "'");

        w = (w << 4) | static_cast<uint32_t> (v);
      }
      g.words[i] = w;
    }
    return g;
  }

  template <size_t N>
  std::string
  to_hex (const array<uint8_t, N>& d)
  {
    ostringstream o;
    o << hex << setfill ('0');
    for (uint8_t b: d)
      o << setw (2) << static_cast<int> (b);
    return o.str ();
  }

  template std::string to_hex (const sha1_digest&);
  template std::string to_hex (const md5_digest&);
  template std::string to_hex (const sha256_digest&);

  sha1_digest
  parse_sha1 (const std::string& s)
  {
    sha1_digest r;

    if (s.size () != r.size () * 2)
      throw invalid_argument ("invalid SHA-1 '" + s + "'");

    for (size_t i (0); i != r.size (); ++i)
    {
      int h (hex_value (s[i * 2]));
      int l (hex_value (s[i * 2 + 1]));

      if (h < 0 || l < 0)
        throw invalid_argument ("invalid SHA-1 '" + s + "'");

      r[i] = static_cast<uint8_t> (h << 4 | l);
    }

    return r;
  }

  sha1_hasher::
  sha1_hasher ()
    : ctx_ (EVP_MD_CTX_new ())
  {
    if (ctx_ == nullptr ||
        EVP_DigestInit_ex (static_cast<EVP_MD_CTX*> (ctx_),
                           EVP_sha1 (),
                           nullptr) != 1)
    {
      EVP_MD_CTX_free (static_cast<EVP_MD_CTX*> (ctx_));
      throw runtime_error ("unable to initialize SHA-1 context");
    }
  }

  sha1_hasher::
  ~sha1_hasher ()
  {
    EVP_MD_CTX_free (static_cast<EVP_MD_CTX*> (ctx_));
  }

  void sha1_hasher::
  update (const void* d, size_t n)
  {
    if (EVP_DigestUpdate (static_cast<EVP_MD_CTX*> (ctx_), d, n) != 1)
      throw runtime_error ("unable to update SHA-1 context");
  }

  sha1_digest sha1_hasher::
  finish ()
  {
    sha1_digest r;
    unsigned int n (0);

    if (EVP_DigestFinal_ex (static_cast<EVP_MD_CTX*> (ctx_),
                            r.data (),
                            &n) != 1 || n != r.size ())
      throw runtime_error ("unable to finalize SHA-1 context");

    return r;
  }

  sha1_digest
  compute_sha1 (const void* d, size_t n)
  {
    sha1_hasher h;
    h.update (d, n);
    return h.finish ();
  }

  sha1_digest
  compute_file_sha1 (const fs::path& p)
  {
    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open " + p.string () + " for hashing");

    sha1_hasher h;

    char buf[65536];
    while (ifs.read (buf, sizeof (buf)) || ifs.gcount () > 0)
      h.update (buf, static_cast<size_t> (ifs.gcount ()));

    if (ifs.bad ())
      throw runtime_error ("unable to read " + p.string () + " for hashing");

    return h.finish ();
  }

  uint64_t file_manifest::
  size () const noexcept
  {
    uint64_t r (0);
    for (const chunk_part& p: parts)
      r += p.size;
    return r;
  }

  const chunk_info* manifest::
  find_chunk (const guid& g) const noexcept
  {
    for (const chunk_info& c: chunks)
      if (c.id == g)
        return &c;
    return nullptr;
  }

  const file_manifest* manifest::
  find_file (const std::string& n) const noexcept
  {
    for (const file_manifest& f: files)
      if (f.filename == n)
        return &f;
    return nullptr;
  }

  std::string manifest::
  chunk_path (const chunk_info& c) const
  {
    char b[64];
    snprintf (b, sizeof (b), "/%02u/%016llX_",
              static_cast<unsigned> (c.group),
              static_cast<unsigned long long> (c.hash));

    return chunk_directory (meta.feature_level) + std::string (b) +
           c.id.string () + ".chunk";
  }

  uint64_t manifest::
  install_size () const noexcept
  {
    uint64_t r (0);
    for (const file_manifest& f: files)
      r += f.size ();
    return r;
  }

  uint64_t manifest::
  download_size () const noexcept
  {
    uint64_t r (0);
    for (const chunk_info& c: chunks)
      r += static_cast<uint64_t> (c.file_size);
    return r;
  }

  const char*
  chunk_directory (uint32_t l) noexcept
  {
    if (l >= 15) return "ChunksV4";
    if (l >= 6)  return "ChunksV3";
    if (l >= 3)  return "ChunksV2";
    return "Chunks";
  }
}
