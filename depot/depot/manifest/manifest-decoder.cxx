#include <depot/manifest/manifest-decoder.hxx>

#include <exception>

#include <depot/errors.hxx>
#include <depot/manifest/manifest-json.hxx>
#include <depot/manifest/manifest-binary.hxx>

using namespace std;

namespace depot
{
  decode_result manifest_decoder::
  try_decode (const manifest_bytes& b) const
  {
    decode_result r;

    try
    {
      r.value = read_binary_manifest (b);
      r.encoding = manifest_encoding::binary;
      return r;
    }
    catch (const exception& e)
    {
      r.primary_error = e.what ();
    }

    try
    {
      r.value = read_json_manifest (b);
      r.encoding = manifest_encoding::json;
    }
    catch (const exception& e)
    {
      r.fallback_error = e.what ();
    }

    return r;
  }

  manifest manifest_decoder::
  decode (const manifest_bytes& b) const
  {
    decode_result r (try_decode (b));

    if (!r)
      throw manifest_invalid (*r.fallback_error, *r.primary_error);

    return move (*r.value);
  }
}
