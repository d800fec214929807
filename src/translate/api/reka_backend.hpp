#pragma once

#include "backend.hpp"

#include <string>

class RekaBackend : public TranslationBackend {
public:
    explicit RekaBackend(std::string endpoint);
    ~RekaBackend() override;

    RekaBackend(const RekaBackend&) = delete;
    RekaBackend& operator=(const RekaBackend&) = delete;

    Result<HttpResponse> post(const std::string& json_body, const std::string& api_key) override;

private:
    std::string endpoint_;
};
