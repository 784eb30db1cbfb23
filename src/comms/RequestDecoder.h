#pragma once
#include "comms/Messages.h"

/*
===============================================================================
  RequestDecoder.h
===============================================================================

  PURPOSE
  -------
  Host -> Robot line decoding. Kept apart from the encoders so it depends
  only on ArduinoJson and builds off-target.
===============================================================================
*/

namespace protocol {

/*
  Attempts to parse one request line.

  Lines starting with '{' must be a JSON "cmd" or "query" object.
  Anything else is taken as a bare command token (surrounding whitespace
  trimmed, seq = 0).

  A query whose "what" is missing or not recognised still decodes, with
  what = QueryKind::UNKNOWN, so the caller can answer it by seq.

  Returns:
    - true if decoded into out_req (and out_req.valid will be true)
    - false on parse failure, missing fields or an oversized token
*/
bool decodeRequestLine(const char* line, RequestFrame& out_req);

QueryKind parseQueryKind(const char* s);

}  // namespace protocol
