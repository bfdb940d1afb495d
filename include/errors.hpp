/**
 * Error codes shared by the capture, reference and publishing pipeline
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

namespace logowatch {

enum class ErrorCode {
  None = 0,
  SourceUnavailable,        // capture cannot be opened / reopened
  EndOfStream,              // source reported no more frames
  ReadTimeout,              // source read exceeded its bounded wait
  InvalidImage,             // reference image missing or undecodable
  FeatureExtractionFailed,  // image produced no usable descriptors
  EncodingFailed,           // annotated frame could not be compressed
  UnknownSlot,              // reload targeted an undeclared slot
  ProcessingFailed          // processing cycle raised an exception
};

const char* errorName(ErrorCode code);

} // namespace logowatch

#endif // ERRORS_HPP
