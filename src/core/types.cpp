#include "core/types.hpp"

#include "core/errors.hpp"

namespace codeloop {

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::ToolCalls:
      return "tool_calls";
    case FinishReason::Length:
      return "length";
    case FinishReason::Error:
      return "error";
    case FinishReason::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

FinishReason finish_reason_from_string(const std::string &str) {
  if (str == "stop" || str == "end_turn") return FinishReason::Stop;
  if (str == "tool_calls" || str == "tool_use") return FinishReason::ToolCalls;
  if (str == "length" || str == "max_tokens") return FinishReason::Length;
  if (str == "error") return FinishReason::Error;
  if (str == "cancelled") return FinishReason::Cancelled;
  return FinishReason::Stop;
}

std::string to_string(SandboxMode mode) {
  switch (mode) {
    case SandboxMode::ReadOnly:
      return "read-only";
    case SandboxMode::WorkspaceWrite:
      return "workspace-write";
    case SandboxMode::DangerFullAccess:
      return "danger-full-access";
  }
  return "read-only";
}

SandboxMode sandbox_mode_from_string(const std::string &str) {
  if (str == "read-only") return SandboxMode::ReadOnly;
  if (str == "workspace-write") return SandboxMode::WorkspaceWrite;
  if (str == "danger-full-access") return SandboxMode::DangerFullAccess;
  throw ConfigError("unknown sandbox mode: " + str);
}

std::string to_string(ApprovalPolicy policy) {
  switch (policy) {
    case ApprovalPolicy::OnRequest:
      return "on-request";
    case ApprovalPolicy::Always:
      return "always";
    case ApprovalPolicy::Never:
      return "never";
  }
  return "on-request";
}

ApprovalPolicy approval_policy_from_string(const std::string &str) {
  if (str == "on-request") return ApprovalPolicy::OnRequest;
  if (str == "always") return ApprovalPolicy::Always;
  if (str == "never") return ApprovalPolicy::Never;
  throw ConfigError("unknown approval policy: " + str);
}

std::string sanitize_utf8(const std::string &input) {
  std::string output;
  output.reserve(input.size());

  auto cont = [&input](size_t idx) {
    return (static_cast<unsigned char>(input[idx]) & 0xC0) == 0x80;
  };

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);

    if (c <= 0x7F) {
      output.push_back(static_cast<char>(c));
      i++;
    } else if ((c & 0xE0) == 0xC0) {
      // 2-byte sequence, reject overlong encodings
      if (i + 1 < input.size() && cont(i + 1)) {
        uint32_t cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(input[i + 1]) & 0x3F);
        if (cp >= 0x80) {
          output.append(input, i, 2);
        } else {
          output.append("\xEF\xBF\xBD");
        }
        i += 2;
      } else {
        output.append("\xEF\xBF\xBD");
        i++;
      }
    } else if ((c & 0xF0) == 0xE0) {
      // 3-byte sequence, no surrogates
      if (i + 2 < input.size() && cont(i + 1) && cont(i + 2)) {
        uint32_t cp =
            ((c & 0x0F) << 12) | ((static_cast<unsigned char>(input[i + 1]) & 0x3F) << 6) | (static_cast<unsigned char>(input[i + 2]) & 0x3F);
        if (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) {
          output.append(input, i, 3);
        } else {
          output.append("\xEF\xBF\xBD");
        }
        i += 3;
      } else {
        output.append("\xEF\xBF\xBD");
        i++;
      }
    } else if ((c & 0xF8) == 0xF0) {
      // 4-byte sequence
      if (i + 3 < input.size() && cont(i + 1) && cont(i + 2) && cont(i + 3)) {
        uint32_t cp = ((c & 0x07) << 18) | ((static_cast<unsigned char>(input[i + 1]) & 0x3F) << 12) |
                      ((static_cast<unsigned char>(input[i + 2]) & 0x3F) << 6) | (static_cast<unsigned char>(input[i + 3]) & 0x3F);
        if (cp >= 0x10000 && cp <= 0x10FFFF) {
          output.append(input, i, 4);
        } else {
          output.append("\xEF\xBF\xBD");
        }
        i += 4;
      } else {
        output.append("\xEF\xBF\xBD");
        i++;
      }
    } else {
      // Invalid leading byte
      output.append("\xEF\xBF\xBD");
      i++;
    }
  }

  return output;
}

}  // namespace codeloop
