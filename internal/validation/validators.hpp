#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "gigbook/v1.hpp"

namespace gigbook::validation {

struct ValidationError {
  std::string path; // camelCase field path, e.g. "notes[2].content"
  std::string message;
};

using ValidationErrors = std::vector<ValidationError>;

/*
  Schema checks per entity: required fields, length and range bounds,
  enum membership and string formats (UUID, email, phone).
  An empty result means the entity may be stored.
*/
ValidationErrors Validate(const v1::Note& note);
ValidationErrors Validate(const v1::SetList& set_list);
ValidationErrors Validate(const v1::Venue& venue);
ValidationErrors Validate(const v1::Contact& contact);
ValidationErrors Validate(const v1::RehearsalSession& session);
ValidationErrors Validate(const v1::Performance& performance);

// "path: message; path: message"
std::string Describe(const ValidationErrors& errors);

bool IsEmail(std::string_view value);
bool IsPhone(std::string_view value);

// Unicode code points in a UTF-8 string.
std::size_t CodePointLength(std::string_view value);

} // namespace gigbook::validation
