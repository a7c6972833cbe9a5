#pragma once

#include <Eigen/Dense>
#include <concepts>
#include <string>
#include <string_view>
#include <vector>

#include "exception.hh"

// Every value flowing through a network (inputs, activations, gradients and
// parameter blobs) is a dense, dynamically sized matrix. Vectors are n x 1.
template<std::floating_point T>
using Tensor = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

// One parameter blob per layer, indexed like the layer list (blob i-1 <-> layer i)
template<std::floating_point T>
using ParameterSet = std::vector<Tensor<T>>;

struct Shape
{
  Eigen::Index rows {};
  Eigen::Index cols {};

  bool operator==( const Shape& other ) const = default;

  std::string to_string() const { return std::to_string( rows ) + "x" + std::to_string( cols ); }
};

template<class MatrixT>
Shape shape_of( const MatrixT& m )
{
  return { m.rows(), m.cols() };
}

inline void check_shape( const Shape& expected, const Shape& actual, const std::string_view what )
{
  if ( expected != actual ) {
    throw shape_mismatch_error( std::string( what ) + ": expected " + expected.to_string() + ", got "
                                + actual.to_string() );
  }
}
