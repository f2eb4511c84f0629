/// @file handlers.cpp
/// @brief Implementation of the classification API handlers

#include "server/handlers/classify_handler.h"
#include "server/handlers/info_handlers.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "classifier/text_utils.h"
#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace promptguard::server::handlers {

using json = nlohmann::json;

namespace {

constexpr char kServiceName[] = "prompt-injection-classifier";

constexpr char kContentTypeMessage[] = "Content-Type must be application/json";
constexpr char kBodyMessage[] = "Request body must be a JSON object";
constexpr char kInputRequiredMessage[] = "Input text is required";
constexpr char kThresholdMessage[] = "Threshold must be a number between 0 and 1";
constexpr char kIncludeFeaturesMessage[] = "include_features must be a boolean";
constexpr char kInputsListMessage[] = "inputs must be a list";
constexpr char kInputsStringsMessage[] = "inputs must contain only strings";

void RecordVerdict(const classifier::Verdict& verdict) {
    PROMPTGUARD_COUNTER("promptguard_classifications_total").Increment();
    switch (verdict.risk) {
        case classifier::RiskLevel::kHigh:
            PROMPTGUARD_COUNTER("promptguard_verdicts_high_total").Increment();
            break;
        case classifier::RiskLevel::kMedium:
            PROMPTGUARD_COUNTER("promptguard_verdicts_medium_total").Increment();
            break;
        case classifier::RiskLevel::kLow:
            PROMPTGUARD_COUNTER("promptguard_verdicts_low_total").Increment();
            break;
    }
}

}  // namespace

// =============================================================================
// Request / Response
// =============================================================================

const char* HttpMethodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::kGet: return "GET";
        case HttpMethod::kPost: return "POST";
        case HttpMethod::kOptions: return "OPTIONS";
    }
    return "GET";
}

std::string HttpRequest::GetHeader(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (absl::EqualsIgnoreCase(key, name)) {
            return value;
        }
    }
    return "";
}

std::string DumpJson(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

HttpResponse HttpResponse::Ok(const json& body) {
    HttpResponse resp;
    resp.status_code = 200;
    resp.body = DumpJson(body);
    return resp;
}

HttpResponse HttpResponse::Text(std::string body, std::string content_type) {
    HttpResponse resp;
    resp.status_code = 200;
    resp.body = std::move(body);
    resp.content_type = std::move(content_type);
    return resp;
}

HttpResponse HttpResponse::Error(int status_code, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = DumpJson(json{{"error", message}});
    return resp;
}

HttpResponse HttpResponse::PayloadTooLarge() {
    return FromStatus(MakeError(ErrorCode::kPayloadTooLarge, "Request body too large"));
}

HttpResponse HttpResponse::FromStatus(const absl::Status& status) {
    const int code = HttpStatusFromStatus(status);
    if (code >= 500) {
        return InternalError();
    }
    return Error(code, std::string(status.message()));
}

// =============================================================================
// Handler helpers
// =============================================================================

absl::Status Handler::RequireJsonContentType(const HttpRequest& request) const {
    std::string content_type = request.GetHeader("Content-Type");
    const size_t params = content_type.find(';');
    if (params != std::string::npos) {
        content_type.resize(params);
    }
    const std::string mime = absl::AsciiStrToLower(absl::StripAsciiWhitespace(content_type));

    if (mime == "application/json" ||
        (absl::StartsWith(mime, "application/") && absl::EndsWith(mime, "+json"))) {
        return absl::OkStatus();
    }
    return ValidationError(kContentTypeMessage);
}

absl::StatusOr<json> Handler::ParseJsonBody(const HttpRequest& request) const {
    json body;
    try {
        body = json::parse(request.body);
    } catch (const json::exception& e) {
        PROMPTGUARD_LOG_DEBUG("Rejected body on {}: {}", request.path, e.what());
        return ValidationError(kBodyMessage);
    }
    if (!body.is_object()) {
        return ValidationError(kBodyMessage);
    }
    return body;
}

absl::StatusOr<double> Handler::ExtractThreshold(const json& body,
                                                 double default_value) const {
    auto it = body.find("threshold");
    if (it == body.end()) {
        return default_value;
    }
    if (!it->is_number()) {
        return ValidationError(kThresholdMessage);
    }
    const double threshold = it->get<double>();
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        return ValidationError(kThresholdMessage);
    }
    return threshold;
}

// =============================================================================
// Registry
// =============================================================================

Handler* HandlerRegistry::FindByRoute(const std::string& path) const {
    for (const auto& handler : handlers_) {
        if (handler->GetRoute() == path) {
            return handler.get();
        }
    }
    return nullptr;
}

HttpResponse HandlerRegistry::Dispatch(const HttpRequest& request,
                                       const HandlerContext& context) const {
    Handler* handler = FindByRoute(request.path);
    if (handler == nullptr) {
        return HttpResponse::NotFound();
    }

    const auto methods = handler->GetMethods();
    if (std::find(methods.begin(), methods.end(), request.method) == methods.end()) {
        return HttpResponse::MethodNotAllowed();
    }

    HttpResponse response;
    try {
        response = handler->Handle(request, context);
    } catch (const std::exception& e) {
        PROMPTGUARD_LOG_ERROR("Error handling {} {}: {}",
                              HttpMethodName(request.method), request.path, e.what());
        return HttpResponse::InternalError();
    }

    if (response.status_code >= 400 && response.status_code < 500) {
        PROMPTGUARD_LOG_WARN("Rejected {} {} with {}",
                             HttpMethodName(request.method), request.path,
                             response.status_code);
    }
    return response;
}

void RegisterDefaultHandlers(HandlerRegistry& registry) {
    registry.Register(std::make_unique<HealthHandler>());
    registry.Register(std::make_unique<ClassifyHandler>());
    registry.Register(std::make_unique<BatchClassifyHandler>());
    registry.Register(std::make_unique<PatternsHandler>());
    registry.Register(std::make_unique<MetricsHandler>());
}

// =============================================================================
// Classification Handlers
// =============================================================================

HttpResponse ClassifyHandler::Handle(const HttpRequest& request,
                                     const HandlerContext& context) {
    if (auto status = RequireJsonContentType(request); !status.ok()) {
        return HttpResponse::FromStatus(status);
    }
    auto body = ParseJsonBody(request);
    if (!body.ok()) {
        return HttpResponse::FromStatus(body.status());
    }

    auto input = body->find("input");
    if (input == body->end() || !input->is_string() ||
        input->get_ref<const std::string&>().empty()) {
        return HttpResponse::BadRequest(kInputRequiredMessage);
    }

    auto threshold = ExtractThreshold(*body, context.config.default_threshold);
    if (!threshold.ok()) {
        return HttpResponse::FromStatus(threshold.status());
    }

    bool include_features = false;
    auto features = body->find("include_features");
    if (features != body->end() && !features->is_null()) {
        if (!features->is_boolean()) {
            return HttpResponse::BadRequest(kIncludeFeaturesMessage);
        }
        include_features = features->get<bool>();
    }

    classifier::Verdict verdict;
    {
        PROMPTGUARD_TIMER(PROMPTGUARD_HISTOGRAM("promptguard_classify_latency_seconds"));
        verdict = context.classifier->Classify(input->get_ref<const std::string&>(), *threshold);
    }
    RecordVerdict(verdict);

    PROMPTGUARD_LOG_INFO("Classified input - risk: {}, score: {}",
                         classifier::RiskLevelToString(verdict.risk), verdict.score);

    return HttpResponse::Ok(classifier::ToJson(verdict, include_features));
}

HttpResponse BatchClassifyHandler::Handle(const HttpRequest& request,
                                          const HandlerContext& context) {
    if (auto status = RequireJsonContentType(request); !status.ok()) {
        return HttpResponse::FromStatus(status);
    }
    auto body = ParseJsonBody(request);
    if (!body.ok()) {
        return HttpResponse::FromStatus(body.status());
    }

    std::vector<std::string> inputs;
    auto inputs_it = body->find("inputs");
    if (inputs_it != body->end()) {
        if (!inputs_it->is_array()) {
            return HttpResponse::BadRequest(kInputsListMessage);
        }
        if (inputs_it->size() > context.config.max_batch_inputs) {
            return HttpResponse::BadRequest(absl::StrCat(
                "Maximum ", context.config.max_batch_inputs, " inputs per batch"));
        }
        inputs.reserve(inputs_it->size());
        for (const auto& item : *inputs_it) {
            if (!item.is_string()) {
                return HttpResponse::BadRequest(kInputsStringsMessage);
            }
            inputs.push_back(item.get<std::string>());
        }
    }

    auto threshold = ExtractThreshold(*body, context.config.default_threshold);
    if (!threshold.ok()) {
        return HttpResponse::FromStatus(threshold.status());
    }

    PROMPTGUARD_COUNTER("promptguard_batch_requests_total").Increment();

    std::vector<classifier::Verdict> verdicts;
    {
        PROMPTGUARD_TIMER(PROMPTGUARD_HISTOGRAM("promptguard_classify_latency_seconds"));
        verdicts = context.classifier->ClassifyBatch(inputs, *threshold, context.pool);
    }

    json results = json::array();
    int64_t high = 0;
    int64_t medium = 0;
    int64_t low = 0;

    for (size_t i = 0; i < verdicts.size(); ++i) {
        const auto& verdict = verdicts[i];
        RecordVerdict(verdict);
        switch (verdict.risk) {
            case classifier::RiskLevel::kHigh: ++high; break;
            case classifier::RiskLevel::kMedium: ++medium; break;
            case classifier::RiskLevel::kLow: ++low; break;
        }

        json result = classifier::ToJson(verdict, /*include_features=*/false);
        result["input"] = classifier::TruncateCodePoints(
            inputs[i], context.config.batch_echo_length);
        results.push_back(std::move(result));
    }

    PROMPTGUARD_LOG_INFO("Batch classified {} inputs", inputs.size());

    return HttpResponse::Ok(json{
        {"results", std::move(results)},
        {"summary", {
            {"total", static_cast<int64_t>(inputs.size())},
            {"high_risk", high},
            {"medium_risk", medium},
            {"low_risk", low}
        }}
    });
}

// =============================================================================
// Info Handlers
// =============================================================================

HttpResponse HealthHandler::Handle(const HttpRequest& /*request*/,
                                   const HandlerContext& /*context*/) {
    return HttpResponse::Ok(json{
        {"status", "healthy"},
        {"service", kServiceName}
    });
}

HttpResponse PatternsHandler::Handle(const HttpRequest& /*request*/,
                                     const HandlerContext& context) {
    json patterns = json::array();
    for (const auto& rule : context.classifier->Rules().Rules()) {
        patterns.push_back(json{
            {"name", rule.name},
            {"weight", rule.weight}
        });
    }
    return HttpResponse::Ok(json{{"patterns", std::move(patterns)}});
}

HttpResponse MetricsHandler::Handle(const HttpRequest& /*request*/,
                                    const HandlerContext& /*context*/) {
    return HttpResponse::Text(MetricsRegistry::Instance().ExportText(),
                              "text/plain; version=0.0.4");
}

}  // namespace promptguard::server::handlers
