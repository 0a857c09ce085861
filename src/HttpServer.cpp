////////////////////////////////////////////////////////////////////////////////
/// @brief http server for health, cluster overview and metrics
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

#include "HttpServer.h"

#include "ClusterController.h"
#include "MetricsRegistry.h"
#include "utils.h"

#include <picojson.h>

#include <glog/logging.h>

using namespace neo4j;
using namespace std;

// newer versions of libmicrohttpd return an enum from the handlers
#if MHD_VERSION >= 0x00097002
#define NEO4J_MHD_RESULT enum MHD_Result
#else
#define NEO4J_MHD_RESULT int
#endif

// -----------------------------------------------------------------------------
// --SECTION--                                                  helper functions
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief callback for daemon
////////////////////////////////////////////////////////////////////////////////

static NEO4J_MHD_RESULT answerRequest (
  void* cls,
  struct MHD_Connection* connection,
  const char* url,
  const char* method,
  const char* version,
  const char* upload_data,
  size_t* upload_data_size,
  void** ptr) {

  static int marker;

  // the first call only announces the request
  if (*ptr == nullptr) {
    *ptr = &marker;
    return MHD_YES;
  }

  if (*upload_data_size != 0) {
    *upload_data_size = 0;
    return MHD_YES;
  }

  HttpServer* me = reinterpret_cast<HttpServer*>(cls);

  string body;
  string contentType;
  int status = me->handle(method, url, body, contentType);

  struct MHD_Response* response = MHD_create_response_from_buffer(
    body.length(), (void*) body.c_str(),
    MHD_RESPMEM_MUST_COPY);

  if (response == nullptr) {
    return MHD_NO;
  }

  MHD_add_response_header(response, "Content-Type", contentType.c_str());
  NEO4J_MHD_RESULT ret = MHD_queue_response(connection, status, response);
  MHD_destroy_response(response);

  return ret;
}

// -----------------------------------------------------------------------------
// --SECTION--                                      constructors and destructors
// -----------------------------------------------------------------------------

HttpServer::HttpServer (ClusterController& controller, MetricsRegistry& metrics)
  : _controller(controller),
    _metrics(metrics),
    _daemon(nullptr) {
}

HttpServer::~HttpServer () {
  stop();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                    public methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief starts the server on a given port
////////////////////////////////////////////////////////////////////////////////

Result HttpServer::start (int port) {
  if (_daemon != nullptr) {
    return Result::noError();
  }

  _daemon = MHD_start_daemon (
    MHD_USE_SELECT_INTERNALLY,
    (uint16_t) port,
    nullptr, nullptr,
    &answerRequest, (void*) this,
    MHD_OPTION_CONNECTION_TIMEOUT, (unsigned int) 120,
    MHD_OPTION_END);

  if (_daemon == nullptr) {
    return Result::error(ResultCode::UNAVAILABLE,
                         "cannot start http server on port " + to_string(port));
  }

  LOG(INFO) << "http server listening on port " << port;
  return Result::noError();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief stops the server
////////////////////////////////////////////////////////////////////////////////

void HttpServer::stop () {
  if (_daemon != nullptr) {
    MHD_stop_daemon(_daemon);
    _daemon = nullptr;
  }
}

////////////////////////////////////////////////////////////////////////////////
/// @brief answers a request, returns the HTTP status
////////////////////////////////////////////////////////////////////////////////

int HttpServer::handle (const string& method,
                        const string& url,
                        string& body,
                        string& contentType) {
  contentType = "application/json; charset=utf-8";

  if (method != MHD_HTTP_METHOD_GET) {
    picojson::object error;
    error["error"] = picojson::value("method not allowed");
    body = picojson::value(error).serialize();
    return MHD_HTTP_METHOD_NOT_ALLOWED;
  }

  VLOG(1) << "handling http request '" << method << " " << url << "'";

  if (url == "/v1/health.json") {
    body = GET_V1_HEALTH();
    return MHD_HTTP_OK;
  }

  if (url == "/v1/clusters.json") {
    body = GET_V1_CLUSTERS();
    return MHD_HTTP_OK;
  }

  if (url == "/metrics") {
    contentType = "text/plain; version=0.0.4; charset=utf-8";
    body = GET_METRICS();
    return MHD_HTTP_OK;
  }

  picojson::object error;
  error["error"] = picojson::value("not found");
  body = picojson::value(error).serialize();
  return MHD_HTTP_NOT_FOUND;
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   private methods
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief GET /v1/health.json
////////////////////////////////////////////////////////////////////////////////

string HttpServer::GET_V1_HEALTH () {
  picojson::object result;
  result["health"] = picojson::value(_controller.running());
  return picojson::value(result).serialize();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief GET /v1/clusters.json
////////////////////////////////////////////////////////////////////////////////

string HttpServer::GET_V1_CLUSTERS () {
  picojson::array clusters;

  for (const auto& it : _controller.snapshot()) {
    string ns;
    string name;

    if (! splitClusterKey(it.first, ns, name)) {
      name = it.first;
    }

    picojson::object c;
    c["namespace"] = picojson::value(ns);
    c["name"] = picojson::value(name);
    c["phase"] = picojson::value(it.second.phase);
    c["lastResult"] = picojson::value(it.second.lastResult);
    c["lastReconciled"] = picojson::value(it.second.lastReconciled);
    c["reconciles"] = picojson::value((double) it.second.reconciles);
    c["watched"] = picojson::value(_controller.monitor().watching(it.first));

    clusters.push_back(picojson::value(c));
  }

  picojson::object result;
  result["clusters"] = picojson::value(clusters);
  return picojson::value(result).serialize();
}

////////////////////////////////////////////////////////////////////////////////
/// @brief GET /metrics
////////////////////////////////////////////////////////////////////////////////

string HttpServer::GET_METRICS () {
  return _metrics.serialize();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                       END-OF-FILE
// -----------------------------------------------------------------------------
