#pragma once

#include <string>

namespace chronicle {

/**
 * @brief Status codes reported by the codec, the reader session, the query engine, the
 * merge iterator and the replay scheduler.
 */
enum class StatusCode {
  Success = 0,
  NotOpen,
  SummaryUnavailable,
  IndexUnavailable,
  InvalidArgument,
  InvalidChannelId,
  FileTooSmall,
  ReadFailed,
  MagicMismatch,
  InvalidFile,
  InvalidRecord,
  InvalidOpCode,
  InvalidChunkOffset,
  InvalidFooter,
  DecompressionFailed,
  DecompressionSizeMismatch,
  UnrecognizedCompression,
  UnsupportedCompression,
  CrcMismatch,
  OpenFailed,
};

/**
 * @brief Coarse error categories. Every StatusCode folds into exactly one of these.
 */
enum class ErrorKind {
  None,
  /// The log has no index section, or the index needed for an operation is missing.
  SummaryUnavailable,
  /// Malformed bytes: a record, chunk or index could not be decoded.
  DecodeFailure,
  /// The operation needs an open source and none is attached.
  NotOpen,
  /// A caller-supplied value is out of range (negative length, inverted range, bad id).
  InvalidArgument,
};

/**
 * @brief Wraps a status code and string message carrying additional context.
 */
struct [[nodiscard]] Status {
  StatusCode code;
  std::string message;

  Status()
      : code(StatusCode::Success) {}

  Status(StatusCode _code)
      : code(_code) {
    switch (code) {
      case StatusCode::Success:
        break;
      case StatusCode::NotOpen:
        message = "not open";
        break;
      case StatusCode::SummaryUnavailable:
        message = "summary unavailable";
        break;
      case StatusCode::IndexUnavailable:
        message = "message index unavailable";
        break;
      case StatusCode::InvalidArgument:
        message = "invalid argument";
        break;
      case StatusCode::InvalidChannelId:
        message = "invalid channel id";
        break;
      case StatusCode::FileTooSmall:
        message = "file too small";
        break;
      case StatusCode::ReadFailed:
        message = "read failed";
        break;
      case StatusCode::MagicMismatch:
        message = "magic mismatch";
        break;
      case StatusCode::InvalidFile:
        message = "invalid file";
        break;
      case StatusCode::InvalidRecord:
        message = "invalid record";
        break;
      case StatusCode::InvalidOpCode:
        message = "invalid opcode";
        break;
      case StatusCode::InvalidChunkOffset:
        message = "invalid chunk offset";
        break;
      case StatusCode::InvalidFooter:
        message = "invalid footer";
        break;
      case StatusCode::DecompressionFailed:
        message = "decompression failed";
        break;
      case StatusCode::DecompressionSizeMismatch:
        message = "decompression size mismatch";
        break;
      case StatusCode::UnrecognizedCompression:
        message = "unrecognized compression";
        break;
      case StatusCode::UnsupportedCompression:
        message = "unsupported compression";
        break;
      case StatusCode::CrcMismatch:
        message = "crc mismatch";
        break;
      case StatusCode::OpenFailed:
        message = "open failed";
        break;
      default:
        message = "unknown";
        break;
    }
  }

  Status(StatusCode _code, const std::string& _message)
      : code(_code)
      , message(_message) {}

  bool ok() const {
    return code == StatusCode::Success;
  }
};

inline ErrorKind KindOf(StatusCode code) {
  switch (code) {
    case StatusCode::Success:
      return ErrorKind::None;
    case StatusCode::NotOpen:
    case StatusCode::OpenFailed:
      return ErrorKind::NotOpen;
    case StatusCode::SummaryUnavailable:
    case StatusCode::IndexUnavailable:
      return ErrorKind::SummaryUnavailable;
    case StatusCode::InvalidArgument:
    case StatusCode::InvalidChannelId:
      return ErrorKind::InvalidArgument;
    default:
      return ErrorKind::DecodeFailure;
  }
}

inline ErrorKind KindOf(const Status& status) {
  return KindOf(status.code);
}

}  // namespace chronicle
