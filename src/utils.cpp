////////////////////////////////////////////////////////////////////////////////
/// @brief utilities
///
/// @file
///
/// DISCLAIMER
///
/// Copyright 2015 ArangoDB GmbH, Cologne, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is ArangoDB GmbH, Cologne, Germany
///
/// @author Dr. Frank Celler
/// @author Copyright 2015, ArangoDB GmbH, Cologne, Germany
////////////////////////////////////////////////////////////////////////////////

#include "utils.h"

#include <time.h>

#include <cctype>

#include <iomanip>
#include <sstream>

#include <curl/curl.h>
#include <glog/logging.h>
#include <google/protobuf/util/json_util.h>

using namespace neo4j;
using namespace std;

// -----------------------------------------------------------------------------
// --SECTION--                                                 private functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief collects the response body
////////////////////////////////////////////////////////////////////////////////

static size_t WriteMemoryCallback(void* contents, size_t size, size_t nmemb,
                                  void *userp) {
  size_t realsize = size * nmemb;
  std::string* mem = static_cast<std::string*>(userp);

  mem->append((char*) contents, realsize);

  return realsize;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                  public functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief computes a FNV hash for strings
////////////////////////////////////////////////////////////////////////////////

uint64_t neo4j::FnvHashString (const vector<string>& texts) {
  uint64_t nMagicPrime = 0x00000100000001b3ULL;
  uint64_t nHashVal = 0xcbf29ce484222325ULL;

  for (const auto& text : texts) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(text.c_str());
    const uint8_t* e = p + text.size();

    for (; p < e;  ++p) {
      nHashVal ^= *p;
      nHashVal *= nMagicPrime;
    }

    // field separator, so that {"ab","c"} and {"a","bc"} differ
    nHashVal ^= 0xff;
    nHashVal *= nMagicPrime;
  }

  return nHashVal;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief hex representation of a hash value
////////////////////////////////////////////////////////////////////////////////

string neo4j::toHex (uint64_t value) {
  ostringstream out;
  out << hex << setw(16) << setfill('0') << value;
  return out.str();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief splits a string
////////////////////////////////////////////////////////////////////////////////

vector<string> neo4j::split (const string& value, char separator) {
  vector<string> result;
  string::size_type p = 0;
  string::size_type q;

  while ((q = value.find(separator, p)) != string::npos) {
    result.emplace_back(value, p, q - p);
    p = q + 1;
  }

  result.emplace_back(value, p);
  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief joins a vector of string
////////////////////////////////////////////////////////////////////////////////

string neo4j::join (const vector<string>& value, string separator) {
  string result = "";
  string sep = "";

  for (const auto& v : value) {
    result += sep + v;
    sep = separator;
  }

  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief jsonify a protobuf message
////////////////////////////////////////////////////////////////////////////////

string neo4j::toJson (::google::protobuf::Message const& msg) {
  string result;
  auto status = ::google::protobuf::util::MessageToJsonString(msg, &result);

  if (! status.ok()) {
    LOG(WARNING)
    << "cannot convert " << msg.GetTypeName() << " to json: "
    << status.ToString();
    return "{}";
  }

  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief converts system time into RFC 3339 UTC
////////////////////////////////////////////////////////////////////////////////

string neo4j::toRFC3339 (const chrono::system_clock::time_point& tp) {
  time_t tt = chrono::system_clock::to_time_t(tp);
  struct tm utc;

  gmtime_r(&tt, &utc);

  char buf[64];
  strftime(buf, sizeof(buf) - 1, "%Y-%m-%dT%H:%M:%SZ", &utc);

  return buf;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief key of a cluster resource, "namespace/name"
////////////////////////////////////////////////////////////////////////////////

string neo4j::clusterKey (const string& ns, const string& name) {
  return ns + "/" + name;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief splits a cluster key
////////////////////////////////////////////////////////////////////////////////

bool neo4j::splitClusterKey (const string& key, string& ns, string& name) {
  vector<string> parts = split(key, '/');

  if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
    return false;
  }

  ns = parts[0];
  name = parts[1];

  return true;
}

string neo4j::trimRight (const string& text) {
  string::size_type n = text.size();

  while (0 < n && isspace(static_cast<unsigned char>(text[n - 1]))) {
    --n;
  }

  return text.substr(0, n);
}

////////////////////////////////////////////////////////////////////////////////
/// @brief do an HTTP request using libcurl
////////////////////////////////////////////////////////////////////////////////

int neo4j::doHTTPRequest (const string& method,
                          const string& url,
                          const string& body,
                          const HttpOptions& options,
                          string& resultBody,
                          long& httpCode) {
  CURL *curl;
  CURLcode res;

  curl = curl_easy_init();

  resultBody.clear();
  httpCode = 0;

  if (! curl) {
    return -1;  // indicate that curl did not properly initialize
  }

  struct curl_slist* headers = nullptr;

  for (const auto& h : options.headers) {
    headers = curl_slist_append(headers, h.c_str());
  }

  if (! options.bearerToken.empty()) {
    string auth = "Authorization: Bearer " + options.bearerToken;
    headers = curl_slist_append(headers, auth.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteMemoryCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, (void*) &resultBody);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "neo4j-operator/1.0");
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeoutMs);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options.timeoutMs);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  if (headers != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  }

  if (! options.basicAuth.empty()) {
    curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl, CURLOPT_USERPWD, options.basicAuth.c_str());
  }

  if (! options.caFile.empty()) {
    curl_easy_setopt(curl, CURLOPT_CAINFO, options.caFile.c_str());
  }

  if (options.insecure) {
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
  }

  if (! body.empty()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long) body.size());
  }

  res = curl_easy_perform(curl);

  if (res != CURLE_OK) {
    LOG(WARNING)
    << "cannot connect to " << url << ", curl error: " << res;
  }
  else {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
  }

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  return res;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief percent-encodes a query parameter
////////////////////////////////////////////////////////////////////////////////

string neo4j::urlEncode (const string& value) {
  string result;
  char* escaped = curl_easy_escape(nullptr, value.c_str(), (int) value.size());

  if (escaped != nullptr) {
    result = escaped;
    curl_free(escaped);
  }

  return result;
}

////////////////////////////////////////////////////////////////////////////////
/// @brief true if the curl result code of doHTTPRequest is a timeout
////////////////////////////////////////////////////////////////////////////////

bool neo4j::isHTTPTimeout (int res) {
  return res == CURLE_OPERATION_TIMEDOUT;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
