#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "duck_engine.h"

namespace pwduck::control
{

  using Json = nlohmann::json;

  // Requests (one JSON object per line):
  //   {"cmd":"status"}
  //   {"cmd":"set_mode","mode":"auto"|"duck"|"restore"}
  //   {"cmd":"set_attenuation","factor":0.3}
  //   {"cmd":"set_threshold","db":-30}
  //   {"cmd":"set_hold","samples":15}
  //   {"cmd":"get_config"}
  // Responses are {"ok":true,...} or {"ok":false,"error":"..."}.
  Json handleRequest(duck::DuckEngine &engine, const Json &req);

  // Parses one request line and returns the serialized response (no trailing newline).
  std::string handleRequestLine(duck::DuckEngine &engine, const std::string &line);

  Json statusToJson(const duck::DuckEngine &engine);

} // namespace pwduck::control
