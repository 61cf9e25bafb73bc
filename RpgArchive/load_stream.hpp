#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "fwd.hpp"

namespace RpgArchive
{

// Thrown on any attempt to read outside data range, or on inconsistent sizes inside data.
class DecodeError final : public std::runtime_error
{
public:
	explicit DecodeError( const std::string& message );
};

// Little-endian reader over bytes range. Does not own data.
class LoadStream final
{
public:
	explicit LoadStream( const LumpData& in_buffer, unsigned int buffer_pos= 0u );
	LoadStream( const unsigned char* data, unsigned int size, unsigned int buffer_pos= 0u );
	~LoadStream();

	unsigned int GetBufferPos() const;
	unsigned int GetSize() const;
	unsigned int GetRemaining() const;
	bool AtEnd() const;

	// Absolute position. Position equal to size is allowed.
	void SetBufferPos( unsigned int pos );
	void Skip( unsigned int bytes );

	// Returns stream for next "size" bytes and moves this stream behind them.
	LoadStream SubStream( unsigned int size );

	void ReadBool( bool& b );

	void ReadInt8  ( int8_t  & i );
	void ReadUInt8 ( uint8_t & i );
	void ReadInt16 ( int16_t & i );
	void ReadUInt16( uint16_t& i );
	void ReadInt32 ( int32_t & i );
	void ReadUInt32( uint32_t& i );
	void ReadInt64 ( int64_t & i );

	void ReadFloat( float& f );

	// Reads "field_size" bytes, result string is cutted at first null.
	void ReadFixedString( unsigned int field_size, std::string& out_str );
	// int32 length, than chars.
	void ReadSizedString( std::string& out_str );

	void ReadBytes( unsigned int size, std::vector<unsigned char>& out_bytes );
	// int32 length, than bytes.
	void ReadSizedBytes( std::vector<unsigned char>& out_bytes );

	// Reads int32 elements count for following array.
	// Count must be non-negative and "count * min_element_size" must fit into rest of data.
	unsigned int ReadCount( unsigned int min_element_size );

private:
	template<class T>
	void Read( T& t );

	void CheckAvailable( unsigned int bytes ) const;

private:
	const unsigned char* data_;
	unsigned int size_;
	unsigned int buffer_pos_;
};

} // namespace RpgArchive
