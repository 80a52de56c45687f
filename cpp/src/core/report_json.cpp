#include "redactor/report_json.hpp"

namespace redactor {

namespace {

boost::json::array method_list(const std::set<DetectionMethod>& methods) {
    boost::json::array out;
    for (DetectionMethod method : methods) {
        out.emplace_back(to_string(method));
    }
    return out;
}

} // namespace

boost::json::object report_to_object(const RedactionReport& report) {
    boost::json::object counts;
    for (const auto& [type, count] : report.entity_counts) {
        counts[to_string(type)] = count;
    }

    boost::json::object obj;
    obj["format"] = to_string(report.format);
    obj["state"] = to_string(report.final_state);
    obj["entity_counts"] = std::move(counts);
    obj["pages_or_sections_processed"] = report.pages_or_sections_processed;
    obj["blocks_processed"] = report.blocks_processed;
    obj["total_findings"] = report.total_findings;
    obj["tokens_emitted"] = report.tokens_emitted;
    obj["original_text_length"] = report.original_text_length;
    obj["redacted_text_length"] = report.redacted_text_length;
    obj["methods_used"] = method_list(report.methods_used);
    obj["degraded_methods"] = method_list(report.degraded_methods);
    obj["reduced_coverage"] = report.reduced_coverage;
    obj["confidence_score"] = report.confidence_score;
    return obj;
}

std::string report_to_json(const RedactionReport& report) {
    return boost::json::serialize(report_to_object(report));
}

std::string error_to_json(const PipelineError& error) {
    boost::json::object obj;
    obj["status"] = "failed";
    obj["kind"] = to_string(error.kind);
    obj["code"] = static_cast<int>(error.code);
    obj["reason"] = error.reason;
    obj["failed_in"] = to_string(error.failed_in);
    if (error.kind == PipelineErrorKind::SecurityViolation) {
        obj["violating_findings"] = error.violating_findings;
    }
    return boost::json::serialize(obj);
}

std::string status_to_json(const std::vector<DetectorStatusEntry>& status) {
    boost::json::array detectors;
    for (const auto& entry : status) {
        detectors.emplace_back(boost::json::object{
            {"method", to_string(entry.method)},
            {"name", entry.name},
            {"available", entry.available},
            {"source", entry.source}});
    }
    boost::json::object obj;
    obj["detectors"] = std::move(detectors);
    return boost::json::serialize(obj);
}

} // namespace redactor
