#pragma once
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace RpgArchive
{

struct FileCloser
{
	void operator()( std::FILE* const file ) const
	{
		if( file != nullptr )
			std::fclose( file );
	}
};

typedef std::unique_ptr<std::FILE, FileCloser> FilePtr;

FilePtr OpenFile( const std::filesystem::path& path, const char* mode );

// Returns number of bytes actually transferred.
unsigned int FileRead( std::FILE* const file, void* buffer, const unsigned int size );
unsigned int FileWrite( std::FILE* const file, const void* buffer, const unsigned int size );

// Returns false, if file can not be opened or can not be read/written entirely.
bool ReadWholeFile( const std::filesystem::path& path, std::vector<unsigned char>& out_content );
bool WriteWholeFile( const std::filesystem::path& path, const std::vector<unsigned char>& content );

} // namespace RpgArchive
