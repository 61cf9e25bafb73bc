#include <cstring>
#include <type_traits>

#include "load_stream.hpp"

namespace RpgArchive
{

DecodeError::DecodeError( const std::string& message )
	: std::runtime_error( message )
{}

LoadStream::LoadStream( const LumpData& in_buffer, const unsigned int buffer_pos )
	: LoadStream( in_buffer.data(), static_cast<unsigned int>(in_buffer.size()), buffer_pos )
{}

LoadStream::LoadStream( const unsigned char* const data, const unsigned int size, const unsigned int buffer_pos )
	: data_(data)
	, size_(size)
	, buffer_pos_(0u)
{
	SetBufferPos( buffer_pos );
}

LoadStream::~LoadStream()
{}

unsigned int LoadStream::GetBufferPos() const
{
	return buffer_pos_;
}

unsigned int LoadStream::GetSize() const
{
	return size_;
}

unsigned int LoadStream::GetRemaining() const
{
	return size_ - buffer_pos_;
}

bool LoadStream::AtEnd() const
{
	return buffer_pos_ >= size_;
}

void LoadStream::SetBufferPos( const unsigned int pos )
{
	if( pos > size_ )
		throw DecodeError( "Seek to " + std::to_string(pos) + " outside data of size " + std::to_string(size_) );

	buffer_pos_= pos;
}

void LoadStream::Skip( const unsigned int bytes )
{
	CheckAvailable( bytes );
	buffer_pos_+= bytes;
}

LoadStream LoadStream::SubStream( const unsigned int size )
{
	CheckAvailable( size );

	LoadStream result( data_ + buffer_pos_, size );
	buffer_pos_+= size;
	return result;
}

void LoadStream::CheckAvailable( const unsigned int bytes ) const
{
	if( bytes > size_ - buffer_pos_ )
		throw DecodeError(
			"Unexpected end of data: need " + std::to_string(bytes) +
			" bytes at offset " + std::to_string(buffer_pos_) +
			", data size is " + std::to_string(size_) );
}

template<class T>
void LoadStream::Read( T& t )
{
	static_assert(
		std::is_integral<T>::value || std::is_floating_point<T>::value,
		"Expected basic types" );

	CheckAvailable( sizeof(T) );

	// Data is little-endian, as host.
	std::memcpy(
		&t,
		data_ + buffer_pos_,
		sizeof(T) );

	buffer_pos_+= sizeof(T);
}

void LoadStream::ReadBool( bool& b )
{
	uint8_t byte;
	Read(byte);
	b= byte != 0u;
}

void LoadStream::ReadInt8  ( int8_t  & i )
{
	Read(i);
}

void LoadStream::ReadUInt8 ( uint8_t & i )
{
	Read(i);
}

void LoadStream::ReadInt16 ( int16_t & i )
{
	Read(i);
}

void LoadStream::ReadUInt16( uint16_t& i )
{
	Read(i);
}

void LoadStream::ReadInt32 ( int32_t & i )
{
	Read(i);
}

void LoadStream::ReadUInt32( uint32_t& i )
{
	Read(i);
}

void LoadStream::ReadInt64 ( int64_t & i )
{
	Read(i);
}

void LoadStream::ReadFloat( float& f )
{
	Read(f);
}

void LoadStream::ReadFixedString( const unsigned int field_size, std::string& out_str )
{
	CheckAvailable( field_size );

	const char* const str= reinterpret_cast<const char*>( data_ + buffer_pos_ );
	unsigned int length= 0u;
	while( length < field_size && str[length] != '\0' )
		length++;

	out_str.assign( str, length );
	buffer_pos_+= field_size;
}

void LoadStream::ReadSizedString( std::string& out_str )
{
	const unsigned int length= ReadCount( 1u );
	ReadFixedString( length, out_str );
}

void LoadStream::ReadBytes( const unsigned int size, std::vector<unsigned char>& out_bytes )
{
	CheckAvailable( size );

	out_bytes.assign( data_ + buffer_pos_, data_ + buffer_pos_ + size );
	buffer_pos_+= size;
}

void LoadStream::ReadSizedBytes( std::vector<unsigned char>& out_bytes )
{
	const unsigned int size= ReadCount( 1u );
	ReadBytes( size, out_bytes );
}

unsigned int LoadStream::ReadCount( const unsigned int min_element_size )
{
	const unsigned int count_pos= buffer_pos_;

	int32_t count;
	ReadInt32( count );

	if( count < 0 )
		throw DecodeError( "Negative count " + std::to_string(count) + " at offset " + std::to_string(count_pos) );

	const uint64_t required= uint64_t(count) * uint64_t(min_element_size);
	if( required > GetRemaining() )
		throw DecodeError(
			"Count " + std::to_string(count) + " at offset " + std::to_string(count_pos) +
			" does not fit into remaining " + std::to_string( GetRemaining() ) + " bytes" );

	return static_cast<unsigned int>(count);
}

} // namespace RpgArchive
