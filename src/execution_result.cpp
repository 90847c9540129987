#include "calcrun/execution_result.h"
#include <json/json.h>

namespace calcrun {

std::string to_json(const ExecutionResult& result) {
    Json::Value json;
    json["success"] = result.success;
    json["stdout"] = result.stdout_text;
    json["stderr"] = result.stderr_text;
    json["error"] = result.error ? Json::Value(*result.error) : Json::Value(Json::nullValue);
    json["exit_code"] = result.exit_code ? Json::Value(*result.exit_code)
                                         : Json::Value(Json::nullValue);
    json["duration_ms"] = static_cast<Json::Int64>(result.duration_ms);
    json["executed_code"] = result.executed_code;
    json["code_sha256"] = result.code_sha256;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, json);
}

} // namespace calcrun
