#include <depot/engine/chunk-file.hxx>

#include <string>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <miniz.h>

#include <depot/manifest/binary-stream.hxx>

using namespace std;

namespace depot
{
  chunk_data
  read_chunk (const vector<uint8_t>& b)
  {
    binary_reader r (b);
    chunk_data c;
    chunk_header& h (c.header);

    if (r.read<uint32_t> ("chunk magic") != chunk_magic)
      throw runtime_error ("not a chunk (bad magic)");

    h.version = r.read<uint32_t> ("chunk header version");
    h.header_size = r.read<uint32_t> ("chunk header size");
    h.compressed_size = r.read<uint32_t> ("chunk data size");

    for (uint32_t& w: h.id.words)
      w = r.read<uint32_t> ("chunk guid");

    h.hash = r.read<uint64_t> ("chunk rolling hash");
    h.stored_as = r.read<uint8_t> ("chunk storage flags");

    if (h.version >= 2)
    {
      h.sha = r.read_bytes<20> ("chunk SHA-1");
      h.hash_type = r.read<uint8_t> ("chunk hash type");
    }
    else
      h.hash_type = chunk_hash_rolling;

    if (h.version >= 3)
      h.uncompressed_size = r.read<uint32_t> ("chunk uncompressed size");
    else
      h.uncompressed_size = 1024 * 1024;

    r.seek (h.header_size, "chunk header");
    const uint8_t* p (r.take (h.compressed_size, "chunk data"));

    if ((h.stored_as & chunk_stored_compressed) != 0)
    {
      c.data.resize (h.uncompressed_size);
      mz_ulong n (h.uncompressed_size);

      int e (mz_uncompress (c.data.data (), &n, p, h.compressed_size));
      if (e != MZ_OK)
        throw runtime_error ("unable to decompress chunk " +
                             h.id.string () + ": " + mz_error (e));

      c.data.resize (n);
    }
    else
      c.data.assign (p, p + h.compressed_size);

    if ((h.hash_type & chunk_hash_sha1) != 0 &&
        compute_sha1 (c.data.data (), c.data.size ()) != h.sha)
      throw runtime_error ("chunk " + h.id.string () + " SHA-1 mismatch");

    return c;
  }

  chunk_data
  read_chunk_file (const fs::path& p)
  {
    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open chunk " + p.string ());

    vector<uint8_t> b ((istreambuf_iterator<char> (ifs)),
                       istreambuf_iterator<char> ());

    if (ifs.bad ())
      throw runtime_error ("unable to read chunk " + p.string ());

    try
    {
      return read_chunk (b);
    }
    catch (const runtime_error& e)
    {
      throw runtime_error (p.string () + ": " + e.what ());
    }
  }

  vector<uint8_t>
  write_chunk (const guid& id,
               uint64_t hash,
               const vector<uint8_t>& data,
               bool compress)
  {
    vector<uint8_t> body;

    if (compress)
    {
      mz_ulong n (mz_compressBound (static_cast<mz_ulong> (data.size ())));
      body.resize (n);

      int e (mz_compress2 (body.data (),
                           &n,
                           data.data (),
                           static_cast<mz_ulong> (data.size ()),
                           MZ_DEFAULT_LEVEL));
      if (e != MZ_OK)
        throw runtime_error (string ("unable to compress chunk: ") +
                             mz_error (e));

      body.resize (n);
    }
    else
      body = data;

    binary_writer w;
    w.write<uint32_t> (chunk_magic);
    w.write<uint32_t> (3);
    w.write<uint32_t> (66);
    w.write<uint32_t> (static_cast<uint32_t> (body.size ()));

    for (uint32_t x: id.words)
      w.write<uint32_t> (x);

    w.write<uint64_t> (hash);
    w.write<uint8_t> (compress ? chunk_stored_compressed : 0);
    w.write_bytes (compute_sha1 (data.data (), data.size ()));
    w.write<uint8_t> (chunk_hash_rolling | chunk_hash_sha1);
    w.write<uint32_t> (static_cast<uint32_t> (data.size ()));
    w.write_bytes (body.data (), body.size ());

    return std::move (w.data ());
  }
}
