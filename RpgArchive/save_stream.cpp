#include <algorithm>

#include "assert.hpp"

#include "save_stream.hpp"

namespace RpgArchive
{

SaveStream::SaveStream( LumpData& out_buffer )
	: buffer_(out_buffer)
{}

SaveStream::~SaveStream()
{}

unsigned int SaveStream::GetBufferPos() const
{
	return static_cast<unsigned int>( buffer_.size() );
}

void SaveStream::WriteFixedString( const std::string& str, const unsigned int field_size )
{
	const size_t pos= buffer_.size();
	buffer_.resize( pos + field_size, 0u );

	const size_t length= std::min( str.size(), size_t(field_size) );
	std::memcpy( buffer_.data() + pos, str.data(), length );
}

void SaveStream::WriteSizedString( const std::string& str )
{
	WriteInt32( static_cast<int32_t>( str.size() ) );
	WriteBytes( str.data(), static_cast<unsigned int>( str.size() ) );
}

void SaveStream::WriteBytes( const void* const data, const unsigned int size )
{
	if( size == 0u )
		return;

	const size_t pos= buffer_.size();
	buffer_.resize( pos + size );
	std::memcpy( buffer_.data() + pos, data, size );
}

void SaveStream::WriteBytes( const std::vector<unsigned char>& bytes )
{
	WriteBytes( bytes.data(), static_cast<unsigned int>( bytes.size() ) );
}

void SaveStream::WriteSizedBytes( const std::vector<unsigned char>& bytes )
{
	WriteInt32( static_cast<int32_t>( bytes.size() ) );
	WriteBytes( bytes );
}

void SaveStream::WriteZeros( const unsigned int count )
{
	buffer_.resize( buffer_.size() + count, 0u );
}

unsigned int SaveStream::BeginBlock( const char* const tag )
{
	const unsigned int block_start= GetBufferPos();
	WriteFixedString( tag, 4u );
	WriteInt32( int32_t(0) );
	return block_start;
}

void SaveStream::EndBlock( const unsigned int block_start )
{
	const unsigned int payload_start= block_start + 8u;
	RA_ASSERT( payload_start <= buffer_.size() );

	PatchInt32( block_start + 4u, static_cast<int32_t>( buffer_.size() - payload_start ) );
}

void SaveStream::PatchInt32( const unsigned int pos, const int32_t value )
{
	RA_ASSERT( pos + sizeof(int32_t) <= buffer_.size() );
	std::memcpy( buffer_.data() + pos, &value, sizeof(int32_t) );
}

} // namespace RpgArchive
