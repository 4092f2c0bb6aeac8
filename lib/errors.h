// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'snipper' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCode {
  NoError = 0,
  InvalidRegion,
  OverlapError,
  EmptyResultError,
  ExternalToolError,
  LoadError,
  Timeout,
  Canceled,
};

inline const char* errorName(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::NoError:
    return "NoError";
  case ErrorCode::InvalidRegion:
    return "InvalidRegion";
  case ErrorCode::OverlapError:
    return "OverlapError";
  case ErrorCode::EmptyResultError:
    return "EmptyResultError";
  case ErrorCode::ExternalToolError:
    return "ExternalToolError";
  case ErrorCode::LoadError:
    return "LoadError";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Canceled:
    return "Canceled";
  }

  return "Unknown";
}

// thrown while probing or loading a media file
class LoadError : public std::runtime_error
{
public:
  explicit LoadError(const std::string& what)
      : std::runtime_error(what)
  {}
};
