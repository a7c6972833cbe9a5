#include "evaluation.hh"
#include "backprop.hh"

#include <ostream>
#include <stdexcept>
#include <string>

using namespace std;

template<std::floating_point T>
NetworkEvaluation<T>::NetworkEvaluation( const Network<T>& network )
  : network_( network )
{}

template<std::floating_point T>
void NetworkEvaluation<T>::allocate( const Tensor<T>& sample_input, const size_t output_layer )
{
  order_ = network_.reverse_topological_order( output_layer );

  const size_t num_layers = network_.num_layers();
  input_ = sample_input;
  output_layer_ = output_layer;
  outputs_.assign( num_layers, nullopt );
  dJdy_.assign( num_layers, nullopt );
  dJdtheta_.assign( num_layers, Tensor<T> {} );
  local_gradients_.assign( num_layers, LayerGradient<T> {} );
  dJdx_ = Tensor<T>::Zero( sample_input.rows(), sample_input.cols() );

  /* each needed layer is run once (inputs before consumers) to learn the shape of its output */
  try {
    for ( auto it = order_.rbegin(); it != order_.rend(); ++it ) {
      const size_t layer_no = *it;

      Tensor<T> output;
      network_.layer( layer_no ).forward( layer_inputs( layer_no ), output );

      dJdy_[layer_no - 1] = Tensor<T>::Zero( output.rows(), output.cols() );
      outputs_[layer_no - 1] = move( output );
    }
  } catch ( const exception& ) {
    input_.reset();
    throw;
  }

  /* unreachable layers get a zero gradient of the right shape, so the
     result lines up with parameters() */
  for ( size_t layer_no = 1; layer_no <= num_layers; ++layer_no ) {
    const Shape shape = network_.layer( layer_no ).parameter_shape();
    dJdtheta_[layer_no - 1] = Tensor<T>::Zero( shape.rows, shape.cols );
  }
}

template<std::floating_point T>
const Tensor<T>& NetworkEvaluation<T>::evaluate( const Tensor<T>& input, const size_t output_layer )
{
  if ( not is_allocated() or output_layer != output_layer_ or shape_of( input ) != shape_of( *input_ ) ) {
    /* allocation leaves the outputs computed for this input */
    allocate( input, output_layer );
    return output();
  }

  /* a failed pass leaves a mix of old and new outputs, so drop the allocation */
  try {
    *input_ = input;
    forward_pass();
  } catch ( const exception& ) {
    input_.reset();
    throw;
  }
  return output();
}

template<std::floating_point T>
void NetworkEvaluation<T>::forward_pass()
{
  for ( auto it = order_.rbegin(); it != order_.rend(); ++it ) {
    const size_t layer_no = *it;
    network_.layer( layer_no ).forward( layer_inputs( layer_no ), *outputs_[layer_no - 1] );
  }
}

template<std::floating_point T>
const ParameterSet<T>& NetworkEvaluation<T>::gradient( const Tensor<T>& seed )
{
  return ::gradient( *this, seed );
}

template<std::floating_point T>
vector<const Tensor<T>*> NetworkEvaluation<T>::layer_inputs( const size_t layer_no ) const
{
  check_allocated();

  vector<const Tensor<T>*> ret;
  for ( const size_t input_no : network_.connections( layer_no ) ) {
    if ( input_no == 0 ) {
      ret.push_back( &*input_ );
    } else {
      check_has_output( input_no );
      ret.push_back( &*outputs_[input_no - 1] );
    }
  }
  return ret;
}

template<std::floating_point T>
void NetworkEvaluation<T>::check_allocated() const
{
  if ( not is_allocated() ) {
    throw runtime_error( "network evaluation has not been allocated" );
  }
}

template<std::floating_point T>
void NetworkEvaluation<T>::check_has_output( const size_t layer_no ) const
{
  if ( not has_output( layer_no ) ) {
    throw runtime_error( "layer " + to_string( layer_no ) + " has no storage in this evaluation" );
  }
}

template<std::floating_point T>
bool NetworkEvaluation<T>::has_output( const size_t layer_no ) const
{
  network_.check_layer_no( layer_no );
  return is_allocated() and outputs_[layer_no - 1].has_value();
}

template<std::floating_point T>
size_t NetworkEvaluation<T>::output_layer() const
{
  check_allocated();
  return output_layer_;
}

template<std::floating_point T>
const Tensor<T>& NetworkEvaluation<T>::input() const
{
  check_allocated();
  return *input_;
}

template<std::floating_point T>
const Tensor<T>& NetworkEvaluation<T>::output( const size_t layer_no ) const
{
  check_has_output( layer_no );
  return *outputs_[layer_no - 1];
}

template<std::floating_point T>
const Tensor<T>& NetworkEvaluation<T>::dJdy( const size_t layer_no ) const
{
  check_has_output( layer_no );
  return *dJdy_[layer_no - 1];
}

template<std::floating_point T>
const Tensor<T>& NetworkEvaluation<T>::dJdtheta( const size_t layer_no ) const
{
  check_allocated();
  network_.check_layer_no( layer_no );
  return dJdtheta_[layer_no - 1];
}

template<std::floating_point T>
const Tensor<T>& NetworkEvaluation<T>::dJdx() const
{
  check_allocated();
  return dJdx_;
}

template<std::floating_point T>
Tensor<T>& NetworkEvaluation<T>::mut_dJdy( const size_t layer_no )
{
  check_has_output( layer_no );
  return *dJdy_[layer_no - 1];
}

template<std::floating_point T>
Tensor<T>& NetworkEvaluation<T>::mut_dJdtheta( const size_t layer_no )
{
  check_allocated();
  network_.check_layer_no( layer_no );
  return dJdtheta_[layer_no - 1];
}

template<std::floating_point T>
Tensor<T>& NetworkEvaluation<T>::mut_dJdx()
{
  check_allocated();
  return dJdx_;
}

template<std::floating_point T>
LayerGradient<T>& NetworkEvaluation<T>::mut_local_gradient( const size_t layer_no )
{
  check_allocated();
  network_.check_layer_no( layer_no );
  return local_gradients_[layer_no - 1];
}

template<std::floating_point T>
ostream& operator<<( ostream& out, const NetworkEvaluation<T>& evaluation )
{
  out << "Evaluation of " << evaluation.network();
  if ( not evaluation.is_allocated() ) {
    return out << ", unallocated";
  }

  out << ", output layer " << evaluation.output_layer() << " using layers (";
  const vector<size_t>& order = evaluation.order();
  for ( auto it = order.rbegin(); it != order.rend(); ++it ) {
    out << *it;
    if ( it + 1 != order.rend() ) {
      out << ", ";
    }
  }
  out << ")";
  return out;
}

template class NetworkEvaluation<float>;
template class NetworkEvaluation<double>;

template ostream& operator<< <float>( ostream&, const NetworkEvaluation<float>& );
template ostream& operator<< <double>( ostream&, const NetworkEvaluation<double>& );
