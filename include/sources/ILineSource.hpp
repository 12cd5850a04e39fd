#pragma once
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>

namespace sentinel::sources {

// Raised by a line source that can no longer deliver lines (I/O failure).
struct SourceError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Sequential line delivery for the ingestion pipeline. Implementations hand
// out lines in file order, across rotations, without duplication or loss.
class ILineSource {
public:
  virtual ~ILineSource() = default;

  // Prepare the source. Return false if it cannot be opened at all.
  [[nodiscard]] virtual bool open() { return true; }

  // Block until the next complete line is available. nullopt means the
  // stream has ended or stop was requested. Throws SourceError on failure.
  [[nodiscard]] virtual std::optional<std::string> next_line(std::stop_token st) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace sentinel::sources
