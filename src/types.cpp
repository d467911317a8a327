#include "huginn/types.h"
#include <stdexcept>

namespace huginn {

const char* to_string(ModelStatus status) {
    switch (status) {
        case ModelStatus::Unloaded: return "unloaded";
        case ModelStatus::Checking: return "checking";
        case ModelStatus::Downloading: return "downloading";
        case ModelStatus::Loading: return "loading";
        case ModelStatus::Ready: return "ready";
        case ModelStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(SegmentKind kind) {
    return kind == SegmentKind::Instant ? "instant" : "final";
}

const char* to_string(TranslationState state) {
    switch (state) {
        case TranslationState::None: return "none";
        case TranslationState::Pending: return "pending";
        case TranslationState::Translated: return "translated";
    }
    return "none";
}

bool is_in_flight(ModelStatus status) {
    return status == ModelStatus::Checking ||
           status == ModelStatus::Downloading ||
           status == ModelStatus::Loading;
}

DeviceType parse_device(const std::string& value) {
    if (value == "cpu" || value == "CPU") return DeviceType::CPU;
    if (value == "cuda" || value == "CUDA") return DeviceType::CUDA;
    if (value == "auto") return DeviceType::Auto;
    throw std::invalid_argument("Unknown device: " + value);
}

ComputeType parse_compute_type(const std::string& value) {
    if (value == "float32") return ComputeType::Float32;
    if (value == "float16") return ComputeType::Float16;
    if (value == "int8") return ComputeType::Int8;
    if (value == "int8_float16") return ComputeType::Int8Float16;
    if (value == "auto" || value == "default") return ComputeType::Auto;
    throw std::invalid_argument("Unknown compute type: " + value);
}

} // namespace huginn
