#include "files.hpp"

namespace RpgArchive
{

FilePtr OpenFile( const std::filesystem::path& path, const char* const mode )
{
	return FilePtr( std::fopen( path.string().c_str(), mode ) );
}

unsigned int FileRead( std::FILE* const file, void* buffer, const unsigned int size )
{
	unsigned int read_total= 0u;

	while( read_total < size )
	{
		const size_t read= std::fread( static_cast<char*>(buffer) + read_total, 1, size - read_total, file );
		if( read == 0u )
			break;

		read_total+= static_cast<unsigned int>(read);
	}

	return read_total;
}

unsigned int FileWrite( std::FILE* const file, const void* buffer, const unsigned int size )
{
	unsigned int write_total= 0u;

	while( write_total < size )
	{
		const size_t write= std::fwrite( static_cast<const char*>(buffer) + write_total, 1, size - write_total, file );
		if( write == 0u )
			break;

		write_total+= static_cast<unsigned int>(write);
	}

	return write_total;
}

bool ReadWholeFile( const std::filesystem::path& path, std::vector<unsigned char>& out_content )
{
	out_content.clear();

	std::error_code ec;
	const std::uintmax_t file_size= std::filesystem::file_size( path, ec );
	if( ec )
		return false;

	const FilePtr file= OpenFile( path, "rb" );
	if( file == nullptr )
		return false;

	out_content.resize( static_cast<size_t>(file_size) );
	if( FileRead( file.get(), out_content.data(), static_cast<unsigned int>(out_content.size()) ) != out_content.size() )
	{
		out_content.clear();
		return false;
	}

	return true;
}

bool WriteWholeFile( const std::filesystem::path& path, const std::vector<unsigned char>& content )
{
	const FilePtr file= OpenFile( path, "wb" );
	if( file == nullptr )
		return false;

	return FileWrite( file.get(), content.data(), static_cast<unsigned int>(content.size()) ) == content.size();
}

} // namespace RpgArchive
