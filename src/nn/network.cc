#include "network.hh"
#include "exception.hh"

#include <string>

using namespace std;

static vector<vector<size_t>> sequential_connections( const size_t num_layers )
{
  vector<vector<size_t>> connections( num_layers );
  for ( size_t i = 0; i < num_layers; ++i ) {
    connections.at( i ) = { i };
  }
  return connections;
}

template<std::floating_point T>
Network<T>::Network( vector<LayerPtr>&& layers, Connections connections )
  : layers_( move( layers ) )
  , connections_( move( connections ) )
{
  if ( layers_.empty() ) {
    throw validation_error( "network has no layers" );
  }

  if ( connections_.size() != layers_.size() ) {
    throw validation_error( "network has " + to_string( layers_.size() ) + " layers but "
                            + to_string( connections_.size() ) + " connection lists" );
  }

  for ( size_t layer_no = 1; layer_no <= layers_.size(); ++layer_no ) {
    const auto& layer = layers_.at( layer_no - 1 );
    const auto& inputs = connections_.at( layer_no - 1 );

    if ( not layer ) {
      throw validation_error( "layer " + to_string( layer_no ) + " is null" );
    }

    for ( const size_t input_no : inputs ) {
      if ( input_no >= layer_no ) {
        throw validation_error( "layer " + to_string( layer_no ) + " takes input from layer "
                                + to_string( input_no ) + " (inputs must come from earlier layers)" );
      }
    }

    if ( inputs.size() != layer->num_inputs() ) {
      throw validation_error( "layer " + to_string( layer_no ) + " (" + string( layer->name() ) + ") has "
                              + to_string( inputs.size() ) + " connection(s) but takes "
                              + to_string( layer->num_inputs() ) + " input(s)" );
    }
  }
}

template<std::floating_point T>
Network<T>::Network( vector<LayerPtr>&& layers )
  : Network( move( layers ), sequential_connections( layers.size() ) )
{}

template<std::floating_point T>
void Network<T>::check_layer_no( const size_t layer_no ) const
{
  if ( layer_no == 0 or layer_no > layers_.size() ) {
    throw validation_error( "layer " + to_string( layer_no ) + " out of range (network has "
                            + to_string( layers_.size() ) + " layers)" );
  }
}

template<std::floating_point T>
const Layer<T>& Network<T>::layer( const size_t layer_no ) const
{
  check_layer_no( layer_no );
  return *layers_[layer_no - 1];
}

template<std::floating_point T>
const vector<size_t>& Network<T>::connections( const size_t layer_no ) const
{
  check_layer_no( layer_no );
  return connections_[layer_no - 1];
}

template<std::floating_point T>
ParameterSet<T> Network<T>::parameters() const
{
  ParameterSet<T> ret;
  ret.reserve( layers_.size() );
  for ( const auto& layer : layers_ ) {
    ret.push_back( layer->parameters() );
  }
  return ret;
}

template<std::floating_point T>
void Network<T>::set_parameters( const ParameterSet<T>& parameters )
{
  if ( parameters.size() != layers_.size() ) {
    throw validation_error( "expected " + to_string( layers_.size() ) + " parameter blobs, got "
                            + to_string( parameters.size() ) );
  }

  /* check every blob before installing any, so a bad set leaves the network unchanged */
  for ( size_t i = 0; i < layers_.size(); ++i ) {
    check_shape( layers_[i]->parameter_shape(),
                 shape_of( parameters[i] ),
                 "layer " + to_string( i + 1 ) + " parameters" );
  }

  for ( size_t i = 0; i < layers_.size(); ++i ) {
    layers_[i]->set_parameters( parameters[i] );
  }
}

template<std::floating_point T>
Tensor<T> Network<T>::evaluate( const Tensor<T>& input, const size_t output_layer ) const
{
  check_layer_no( output_layer );
  return evaluate_layer( input, output_layer );
}

template<std::floating_point T>
Tensor<T> Network<T>::evaluate_layer( const Tensor<T>& input, const size_t layer_no ) const
{
  if ( layer_no == 0 ) {
    return input;
  }

  const auto& inputs = connections_[layer_no - 1];

  vector<Tensor<T>> values;
  values.reserve( inputs.size() );
  for ( const size_t input_no : inputs ) {
    values.push_back( evaluate_layer( input, input_no ) );
  }

  vector<const Tensor<T>*> value_ptrs;
  value_ptrs.reserve( values.size() );
  for ( const auto& value : values ) {
    value_ptrs.push_back( &value );
  }

  Tensor<T> output;
  layers_[layer_no - 1]->forward( value_ptrs, output );
  return output;
}

template<std::floating_point T>
vector<size_t> Network<T>::reverse_topological_order( const size_t output_layer ) const
{
  check_layer_no( output_layer );

  /* explicit worklist, so deep networks don't grow the call stack */
  vector<bool> needed( layers_.size() + 1, false );
  vector<size_t> worklist { output_layer };
  needed.at( output_layer ) = true;

  while ( not worklist.empty() ) {
    const size_t layer_no = worklist.back();
    worklist.pop_back();

    for ( const size_t input_no : connections_[layer_no - 1] ) {
      if ( input_no > 0 and not needed.at( input_no ) ) {
        needed.at( input_no ) = true;
        worklist.push_back( input_no );
      }
    }
  }

  /* every connection points to a lower number, so descending order is reverse-topological */
  vector<size_t> order;
  for ( size_t layer_no = output_layer; layer_no > 0; --layer_no ) {
    if ( needed.at( layer_no ) ) {
      order.push_back( layer_no );
    }
  }
  return order;
}

template<std::floating_point T>
ostream& operator<<( ostream& out, const Network<T>& network )
{
  out << "Network with layers (";
  for ( size_t layer_no = 1; layer_no <= network.num_layers(); ++layer_no ) {
    out << network.layer( layer_no ).name();
    if ( layer_no < network.num_layers() ) {
      out << ", ";
    }
  }
  out << ")";
  return out;
}

template class Network<float>;
template class Network<double>;

template ostream& operator<< <float>( ostream&, const Network<float>& );
template ostream& operator<< <double>( ostream&, const Network<double>& );
