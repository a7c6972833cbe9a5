#pragma once

#include <concepts>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

// Reads the fixed-width fields of a saved parameter file.
// Counts are big-endian uint32; scalars are copied in host byte order.
class ByteReader
{
  std::string_view remaining_;

  std::string_view take( const size_t len, const std::string_view what )
  {
    if ( len > remaining_.size() ) {
      throw std::runtime_error( "truncated input reading " + std::string( what ) + ": need " + std::to_string( len )
                                + " bytes, " + std::to_string( remaining_.size() ) + " left" );
    }
    const std::string_view ret = remaining_.substr( 0, len );
    remaining_.remove_prefix( len );
    return ret;
  }

public:
  explicit ByteReader( const std::string_view input )
    : remaining_( input )
  {}

  std::string_view remaining() const { return remaining_; }

  // Consume a fixed tag, failing if the input holds anything else there
  void expect_tag( const std::string_view tag )
  {
    if ( take( tag.size(), "tag" ) != tag ) {
      throw std::runtime_error( "expected \"" + std::string( tag ) + "\" tag" );
    }
  }

  uint32_t count( const std::string_view what )
  {
    uint32_t ret = 0;
    for ( const char byte : take( sizeof( uint32_t ), what ) ) {
      ret = ( ret << 8 ) | static_cast<uint8_t>( byte );
    }
    return ret;
  }

  template<std::floating_point T>
  T scalar()
  {
    T ret;
    memcpy( &ret, take( sizeof( T ), "scalar" ).data(), sizeof( T ) );
    return ret;
  }
};

// Writes into a caller-sized buffer, refusing to run past its end
class ByteWriter
{
  std::span<char> buffer_;
  size_t written_ {};

  std::span<char> reserve( const size_t len )
  {
    if ( written_ + len > buffer_.size() ) {
      throw std::runtime_error( "output buffer too small: " + std::to_string( buffer_.size() ) + " bytes" );
    }
    const std::span<char> ret = buffer_.subspan( written_, len );
    written_ += len;
    return ret;
  }

public:
  explicit ByteWriter( const std::span<char> buffer )
    : buffer_( buffer )
  {}

  size_t bytes_written() const { return written_; }

  void tag( const std::string_view tag ) { memcpy( reserve( tag.size() ).data(), tag.data(), tag.size() ); }

  void count( const uint32_t value )
  {
    const std::span<char> out = reserve( sizeof( uint32_t ) );
    for ( size_t i = 0; i < sizeof( uint32_t ); ++i ) {
      out[i] = static_cast<char>( ( value >> ( 8 * ( sizeof( uint32_t ) - 1 - i ) ) ) & 0xff );
    }
  }

  template<std::floating_point T>
  void scalar( const T value )
  {
    memcpy( reserve( sizeof( T ) ).data(), &value, sizeof( T ) );
  }
};
