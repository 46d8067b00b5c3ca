// src/runtime/http_client.cpp
#include "actflow/runtime/http_client.h"

namespace actflow {

Value HttpResponse::json() const {
    Value parsed = Value::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        throw HttpError("Response is not valid JSON (HTTP " + std::to_string(status_code) + ")", status_code);
    }
    return parsed;
}

} // namespace actflow
