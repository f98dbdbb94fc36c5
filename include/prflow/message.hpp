#pragma once
#include <prflow/error.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace prflow {

// Squash messages this short carry no per-commit content.
constexpr std::size_t kTrivialMessageLines = 3;

std::size_t count_lines(const std::string &text);

bool is_trivial_squash_message(const std::string &text);

// git's scissors line; nothing from it on is committed.
inline const std::string kScissorsLine =
    "# ------------------------ >8 ------------------------";

// Candidate, a blank line, the scissors line, then the previous text with
// every line that is not already a '#' comment turned into one.
std::string compose_message(const std::string &candidate,
                            const std::string &previous);

// Text before the first scissors line, trailing blank lines dropped. Lines
// starting with '#' above it are kept verbatim.
std::string committable_message(const std::string &buffer);

// Missing file reads as nullopt; an unreadable one is a CommandFailure.
Result<std::optional<std::string>>
read_message_buffer(const std::filesystem::path &path);

Status write_message_buffer(const std::filesystem::path &path,
                            const std::string &text);

// Reads the buffer fully, closes it, then rewrites it with compose_message.
Status rewrite_message_buffer(const std::filesystem::path &path,
                              const std::string &candidate);

} // namespace prflow
