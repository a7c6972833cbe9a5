#pragma once

#include <stdexcept>
#include <string>

// Structural problems with a network: bad connection indices, wrong arity,
// wrong parameter count. Detected when the network is built or the call is made.
class validation_error : public std::runtime_error
{
public:
  validation_error( const std::string& what )
    : std::runtime_error( what )
  {}
};

// A layer variant that has not implemented forward() or backward().
class not_implemented_error : public std::runtime_error
{
public:
  not_implemented_error( const std::string& what )
    : std::runtime_error( what )
  {}
};

// Dimension-incompatible operands inside a layer's arithmetic.
class shape_mismatch_error : public std::runtime_error
{
public:
  shape_mismatch_error( const std::string& what )
    : std::runtime_error( what )
  {}
};
