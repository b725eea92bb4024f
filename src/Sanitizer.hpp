#ifndef SANITIZER_HPP
#define SANITIZER_HPP

#include <string>

// Turn arbitrary tag text into a single filesystem-safe path component.
// Never returns an empty string and never returns a reserved device name.
std::string sanitize(const std::string& text);

// True when the name matches CON, PRN, AUX, NUL, COM1-9 or LPT1-9 ignoring case.
bool isReservedDeviceName(const std::string& name);

#endif
