#pragma once

#include <concepts>

#include "byte_io.hh"
#include "network.hh"

// Save and restore the parameters of a network.
// The network's structure (its layers and connections) is not stored: the
// network being parsed into must already have the same layers, in the same
// order, with the same parameter shapes.
//
// Layout: "network " tag, layer count, then per layer a "layer   " tag,
// rows, cols, and rows*cols scalars in column-major order.

namespace LayerSerDes {
template<std::floating_point T>
void serialize( const Tensor<T>& parameters, ByteWriter& out );

// Reads into parameters, whose shape must match the stored one
template<std::floating_point T>
void parse( Tensor<T>& parameters, ByteReader& in );

template<std::floating_point T>
size_t serialized_length( const Shape& shape );
}

namespace NetworkSerDes {
template<std::floating_point T>
void serialize( const Network<T>& network, ByteWriter& out );

// All-or-nothing: on any error the network keeps its old parameters
template<std::floating_point T>
void parse( Network<T>& network, ByteReader& in );

// Number of bytes serialize() will write
template<std::floating_point T>
size_t serialized_length( const Network<T>& network );
}

using NetworkSerDes::parse;
using NetworkSerDes::serialize;
using NetworkSerDes::serialized_length;
