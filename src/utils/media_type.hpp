#pragma once
#include <string>

// Best-effort media type from the extension of an entry name.
// Unknown or missing extensions give "application/octet-stream".
std::string guessMediaType(const std::string& name);
