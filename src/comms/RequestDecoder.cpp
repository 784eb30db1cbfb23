#include "comms/RequestDecoder.h"

#include <ArduinoJson.h>
#include <ctype.h>
#include <string.h>

#include "Params.h"

// Copy [begin, end) trimmed of whitespace into dst. False if empty or too long.
static bool copyTrimmed(const char* begin, const char* end, char* dst, size_t dst_size) {
  while (begin < end && isspace((unsigned char)*begin)) begin++;
  while (end > begin && isspace((unsigned char)*(end - 1))) end--;

  const size_t n = (size_t)(end - begin);
  if (n == 0 || n + 1 > dst_size) return false;

  memcpy(dst, begin, n);
  dst[n] = '\0';
  return true;
}


namespace protocol {

QueryKind parseQueryKind(const char* s) {
  if (!s) return QueryKind::UNKNOWN;
  if (strcmp(s, "distance") == 0) return QueryKind::DISTANCE;
  if (strcmp(s, "odometry") == 0) return QueryKind::ODOMETRY;
  if (strcmp(s, "status") == 0)   return QueryKind::STATUS;
  return QueryKind::UNKNOWN;
}

bool decodeRequestLine(const char* line, RequestFrame& out_req) {
  out_req = RequestFrame();   // reset everything
  if (!line) return false;

  const char* p = line;
  while (*p && isspace((unsigned char)*p)) p++;
  if (*p == '\0') return false;

  // Bare token from a serial terminal
  if (*p != '{') {
    if (!copyTrimmed(p, p + strlen(p), out_req.token, sizeof(out_req.token))) {
      return false;
    }
    out_req.type = RequestType::CMD;
    out_req.bare = true;
    out_req.valid = true;
    return true;
  }

  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;
  if (deserializeJson(doc, p)) {
    return false;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return false;

  const char* type = obj["type"];
  if (!type) return false;

  out_req.seq = obj["seq"] | 0UL;

  if (strcmp(type, "cmd") == 0) {
    const char* token = obj["token"];
    if (!token) return false;

    const size_t n = strlen(token);
    if (n == 0 || n + 1 > sizeof(out_req.token)) return false;
    memcpy(out_req.token, token, n + 1);

    out_req.type = RequestType::CMD;
    out_req.valid = true;
    return true;
  }

  if (strcmp(type, "query") == 0) {
    // Unknown kinds are answered by the link, not rejected here
    out_req.what = parseQueryKind(obj["what"]);
    out_req.type = RequestType::QUERY;
    out_req.valid = true;
    return true;
  }

  return false;
}

}  // namespace protocol
