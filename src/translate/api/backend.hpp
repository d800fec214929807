#pragma once

#include "error.hpp"

#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
};

class TranslationBackend {
public:
    virtual ~TranslationBackend() = default;
    // One POST of a JSON body. Only transport failures are errors; the
    // body of a non-2xx response is returned for the caller to inspect.
    virtual Result<HttpResponse> post(const std::string& json_body, const std::string& api_key) = 0;
};
