#pragma once
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

#include "fwd.hpp"

namespace RpgArchive
{

// Little-endian writer, appends data to end of buffer.
class SaveStream final
{
public:
	explicit SaveStream( LumpData& out_buffer );
	~SaveStream();

	unsigned int GetBufferPos() const;

	template<class T>
	void WriteBool( const T& b );

	template<class T>
	void WriteInt8  ( const T& i );
	template<class T>
	void WriteUInt8 ( const T& i );
	template<class T>
	void WriteInt16 ( const T& i );
	template<class T>
	void WriteUInt16( const T& i );
	template<class T>
	void WriteInt32 ( const T& i );
	template<class T>
	void WriteUInt32( const T& i );
	template<class T>
	void WriteInt64 ( const T& i );

	template<class T>
	void WriteFloat( const T& f );

	// Writes string into field of exactly "field_size" bytes. Longer strings are cutted, shorter are null-padded.
	void WriteFixedString( const std::string& str, unsigned int field_size );
	void WriteSizedString( const std::string& str );

	void WriteBytes( const void* data, unsigned int size );
	void WriteBytes( const std::vector<unsigned char>& bytes );
	void WriteSizedBytes( const std::vector<unsigned char>& bytes );
	void WriteZeros( unsigned int count );

	// Writes 4-byte tag and placeholder for int32 size. Returns position of block start.
	unsigned int BeginBlock( const char* tag );
	// Writes size of data, written after BeginBlock.
	void EndBlock( unsigned int block_start );

	void PatchInt32( unsigned int pos, int32_t value );

private:
	template<class T>
	void Write( const T& t );

private:
	LumpData& buffer_;
};

template<class T>
void SaveStream::WriteBool( const T& b )
{
	static_assert( std::is_same< T, bool >::value, "Invalid type" );
	Write( uint8_t( b ? 1u : 0u ) );
}

template<class T>
void SaveStream::WriteInt8  ( const T& i )
{
	static_assert( std::is_same< T, int8_t   >::value, "Invalid type" );
	Write( i );
}

template<class T>
void SaveStream::WriteUInt8 ( const T& i )
{
	static_assert( std::is_same< T, uint8_t  >::value, "Invalid type" );
	Write( i );
}

template<class T>
void SaveStream::WriteInt16 ( const T& i )
{
	static_assert( std::is_same< T, int16_t  >::value, "Invalid type" );
	Write( i );
}

template<class T>
void SaveStream::WriteUInt16( const T& i )
{
	static_assert( std::is_same< T, uint16_t >::value, "Invalid type" );
	Write( i );
}

template<class T>
void SaveStream::WriteInt32 ( const T& i )
{
	static_assert( std::is_same< T, int32_t  >::value, "Invalid type" );
	Write( i );
}

template<class T>
void SaveStream::WriteUInt32( const T& i )
{
	static_assert( std::is_same< T, uint32_t >::value, "Invalid type" );
	Write( i );
}

template<class T>
void SaveStream::WriteInt64 ( const T& i )
{
	static_assert( std::is_same< T, int64_t  >::value, "Invalid type" );
	Write( i );
}

template<class T>
void SaveStream::WriteFloat( const T& f )
{
	static_assert( std::is_same< T, float >::value, "Invalid type" );
	Write( f );
}

template<class T>
void SaveStream::Write( const T& t )
{
	static_assert(
		std::is_integral<T>::value || std::is_floating_point<T>::value,
		"Expected basic types" );

	const size_t pos= buffer_.size();
	buffer_.resize( pos + sizeof(T) );
	std::memcpy(
		buffer_.data() + pos,
		&t,
		sizeof(T) );
}

} // namespace RpgArchive
