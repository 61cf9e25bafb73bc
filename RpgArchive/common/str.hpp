#pragma once
#include <string>

namespace RpgArchive
{

bool StartsWith( const std::string& str, const std::string& prefix );
bool EndsWith( const std::string& str, const std::string& suffix );

std::string ToUpper( const std::string& s );
std::string ToLower( const std::string& s );

// Returns string, cutted at first null symbol.
std::string CutAtNull( const char* data, unsigned int max_length );

} // namespace RpgArchive
