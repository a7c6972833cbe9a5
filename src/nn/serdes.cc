#include "serdes.hh"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace std;

static constexpr string_view network_tag = "network ";
static constexpr string_view layer_tag = "layer   ";

namespace LayerSerDes {
template<std::floating_point T>
void serialize( const Tensor<T>& parameters, ByteWriter& out )
{
  out.tag( layer_tag );
  out.count( static_cast<uint32_t>( parameters.rows() ) );
  out.count( static_cast<uint32_t>( parameters.cols() ) );

  /* Eigen's default storage is column-major, so data() is already in file order */
  for ( const T value : span<const T>( parameters.data(), static_cast<size_t>( parameters.size() ) ) ) {
    out.scalar( value );
  }
}

template<std::floating_point T>
void parse( Tensor<T>& parameters, ByteReader& in )
{
  in.expect_tag( layer_tag );
  const Eigen::Index rows = in.count( "rows" );
  const Eigen::Index cols = in.count( "cols" );
  check_shape( shape_of( parameters ), Shape { rows, cols }, "stored parameters" );

  for ( T& value : span<T>( parameters.data(), static_cast<size_t>( parameters.size() ) ) ) {
    value = in.scalar<T>();
  }
}

template<std::floating_point T>
size_t serialized_length( const Shape& shape )
{
  return layer_tag.size() + 2 * sizeof( uint32_t ) + static_cast<size_t>( shape.rows * shape.cols ) * sizeof( T );
}
}

namespace NetworkSerDes {
template<std::floating_point T>
void serialize( const Network<T>& network, ByteWriter& out )
{
  out.tag( network_tag );
  out.count( static_cast<uint32_t>( network.num_layers() ) );

  for ( const auto& parameters : network.parameters() ) {
    LayerSerDes::serialize( parameters, out );
  }
}

template<std::floating_point T>
void parse( Network<T>& network, ByteReader& in )
{
  in.expect_tag( network_tag );
  const uint32_t num_layers = in.count( "layer count" );
  if ( num_layers != network.num_layers() ) {
    throw runtime_error( "layer count mismatch: network has " + to_string( network.num_layers() )
                         + " layers, input has " + to_string( num_layers ) );
  }

  /* parse into a copy, so a bad input leaves the network unchanged */
  ParameterSet<T> parameters = network.parameters();
  for ( auto& blob : parameters ) {
    LayerSerDes::parse( blob, in );
  }

  network.set_parameters( parameters );
}

template<std::floating_point T>
size_t serialized_length( const Network<T>& network )
{
  size_t ret = network_tag.size() + sizeof( uint32_t );
  for ( size_t layer_no = 1; layer_no <= network.num_layers(); ++layer_no ) {
    ret += LayerSerDes::serialized_length<T>( network.layer( layer_no ).parameter_shape() );
  }
  return ret;
}
}

template void NetworkSerDes::serialize<float>( const Network<float>&, ByteWriter& );
template void NetworkSerDes::parse<float>( Network<float>&, ByteReader& );
template size_t NetworkSerDes::serialized_length<float>( const Network<float>& );

template void NetworkSerDes::serialize<double>( const Network<double>&, ByteWriter& );
template void NetworkSerDes::parse<double>( Network<double>&, ByteReader& );
template size_t NetworkSerDes::serialized_length<double>( const Network<double>& );
