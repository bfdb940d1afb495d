#include "errors.hpp"

namespace logowatch {

const char* errorName(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:                    return "None";
    case ErrorCode::SourceUnavailable:       return "SourceUnavailable";
    case ErrorCode::EndOfStream:             return "EndOfStream";
    case ErrorCode::ReadTimeout:             return "ReadTimeout";
    case ErrorCode::InvalidImage:            return "InvalidImage";
    case ErrorCode::FeatureExtractionFailed: return "FeatureExtractionFailed";
    case ErrorCode::EncodingFailed:          return "EncodingFailed";
    case ErrorCode::UnknownSlot:             return "UnknownSlot";
    case ErrorCode::ProcessingFailed:        return "ProcessingFailed";
  }
  return "Unknown";
}

} // namespace logowatch
