#pragma once

#include <railtriage/core/complaint.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace railtriage::nlp {

enum class ChatIntent : std::uint8_t {
  Emergency,
  Complaint,
  Status,
  Greeting,
  Thanks,
  General,
};

/// Railway identifiers mentioned in a chat message.
struct ChatEntities {
  std::optional<std::string> train_number;  // 5 digits
  std::optional<std::string> coach_number;  // e.g. "B2", uppercase
  std::optional<std::string> seat_number;   // 1-100
  std::optional<std::string> pnr_number;    // 10 digits
};

struct ChatAnalysis {
  ChatIntent intent{ChatIntent::General};
  ChatEntities entities;
};

/// Turns a free-form chat message into a candidate complaint record.
/// The dialogue around it (responses, suggested actions) belongs to the chat collaborator.
class ChatIntake {
 public:
  /// Intent priority: emergency > complaint > status > greeting > thanks > general.
  [[nodiscard]] ChatAnalysis analyze(std::string_view message) const;

  /// Candidate complaint for Emergency/Complaint intents, nullopt otherwise or for a
  /// blank message. reporter_location is "train <n> coach <c>" from whatever is present.
  [[nodiscard]] std::optional<core::ComplaintInput> to_complaint(
      std::string_view message,
      core::Timestamp submitted_at) const;
};

[[nodiscard]] const char* to_string(ChatIntent intent) noexcept;

}  // namespace railtriage::nlp
