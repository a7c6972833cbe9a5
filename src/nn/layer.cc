#include "layer.hh"
#include "exception.hh"
#include "random.hh"

#include <cmath>
#include <string>

using namespace std;

template<std::floating_point T>
void Layer<T>::forward( Inputs, Tensor<T>& ) const
{
  throw not_implemented_error( string( name() ) + " has no forward implementation" );
}

template<std::floating_point T>
void Layer<T>::backward( Inputs, const Tensor<T>&, const Tensor<T>&, LayerGradient<T>& ) const
{
  throw not_implemented_error( string( name() ) + " has no backward implementation" );
}

template<std::floating_point T>
void Layer<T>::set_parameters( const Tensor<T>& parameters )
{
  check_shape( parameter_shape(), shape_of( parameters ), string( name() ) + " parameters" );
}

template<std::floating_point T>
void Layer<T>::check_arity( Inputs inputs ) const
{
  if ( inputs.size() != num_inputs() ) {
    throw validation_error( string( name() ) + " expects " + to_string( num_inputs() ) + " input(s), got "
                            + to_string( inputs.size() ) );
  }
}

template<std::floating_point T>
Tensor<T> glorot_uniform( const size_t rows, const size_t cols, default_random_engine& prng )
{
  const T limit = sqrt( T( 6 ) / T( rows + cols ) );
  uniform_real_distribution<T> distribution { -limit, limit };

  Tensor<T> ret( rows, cols );
  for ( Eigen::Index i = 0; i < ret.size(); ++i ) {
    *( ret.data() + i ) = distribution( prng );
  }
  return ret;
}

/* ConstUnit */

template<std::floating_point T>
ConstUnit<T>::ConstUnit( const Tensor<T>& value )
  : value_( value )
{}

template<std::floating_point T>
void ConstUnit<T>::forward( Inputs inputs, Tensor<T>& output ) const
{
  this->check_arity( inputs );
  output = value_;
}

template<std::floating_point T>
void ConstUnit<T>::backward( Inputs inputs,
                             const Tensor<T>& output,
                             const Tensor<T>& dJdy,
                             LayerGradient<T>& gradient ) const
{
  this->check_arity( inputs );
  check_shape( shape_of( output ), shape_of( dJdy ), "ConstUnit dJ/dy" );

  // identity with respect to its own value
  gradient.inputs.clear();
  gradient.parameters = dJdy;
}

template<std::floating_point T>
void ConstUnit<T>::set_parameters( const Tensor<T>& parameters )
{
  check_shape( parameter_shape(), shape_of( parameters ), "ConstUnit parameters" );
  value_ = parameters;
}

/* Linear */

template<std::floating_point T>
Linear<T>::Linear( const Tensor<T>& weights, const Tensor<T>& biases )
  : weights_and_biases_( weights.rows(), weights.cols() + 1 )
{
  check_shape( { weights.rows(), 1 }, shape_of( biases ), "Linear biases" );
  weights_and_biases_.leftCols( weights.cols() ) = weights;
  weights_and_biases_.rightCols( 1 ) = biases;
}

template<std::floating_point T>
Linear<T>::Linear( const size_t input_size, const size_t output_size, default_random_engine& prng )
  : Linear( glorot_uniform<T>( output_size, input_size, prng ), Tensor<T>::Zero( output_size, 1 ) )
{}

template<std::floating_point T>
static Tensor<T> default_weights( const size_t input_size, const size_t output_size )
{
  auto prng = get_random_engine();
  return glorot_uniform<T>( output_size, input_size, prng );
}

template<std::floating_point T>
Linear<T>::Linear( const size_t input_size, const size_t output_size )
  : Linear( default_weights<T>( input_size, output_size ), Tensor<T>::Zero( output_size, 1 ) )
{}

template<std::floating_point T>
const Tensor<T>& Linear<T>::checked_input( Inputs inputs ) const
{
  this->check_arity( inputs );
  const Tensor<T>& input = *inputs[0];
  check_shape( { input_size(), 1 }, shape_of( input ), string( this->name() ) + " input" );
  return input;
}

template<std::floating_point T>
void Linear<T>::apply_affine( const Tensor<T>& input, Tensor<T>& output ) const
{
  output.noalias() = weights() * input;
  output += biases();
}

template<std::floating_point T>
void Linear<T>::differentiate_affine( const Tensor<T>& input, const Tensor<T>& dJdz, LayerGradient<T>& gradient ) const
{
  gradient.inputs.resize( 1 );
  gradient.inputs[0].noalias() = weights().transpose() * dJdz;

  gradient.parameters.resize( output_size(), input_size() + 1 );
  gradient.parameters.leftCols( input_size() ).noalias() = dJdz * input.transpose(); /* outer product */
  gradient.parameters.rightCols( 1 ) = dJdz;
}

template<std::floating_point T>
void Linear<T>::forward( Inputs inputs, Tensor<T>& output ) const
{
  apply_affine( checked_input( inputs ), output );
}

template<std::floating_point T>
void Linear<T>::backward( Inputs inputs,
                          const Tensor<T>& output,
                          const Tensor<T>& dJdy,
                          LayerGradient<T>& gradient ) const
{
  const Tensor<T>& input = checked_input( inputs );
  check_shape( shape_of( output ), shape_of( dJdy ), "Linear dJ/dy" );
  differentiate_affine( input, dJdy, gradient );
}

template<std::floating_point T>
void Linear<T>::set_parameters( const Tensor<T>& parameters )
{
  check_shape( parameter_shape(), shape_of( parameters ), string( this->name() ) + " parameters" );
  weights_and_biases_ = parameters;
}

/* RectifiedLinear */

template<std::floating_point T>
void RectifiedLinear<T>::forward( Inputs inputs, Tensor<T>& output ) const
{
  this->apply_affine( this->checked_input( inputs ), output );
  output = output.cwiseMax( T( 0 ) );
}

template<std::floating_point T>
void RectifiedLinear<T>::backward( Inputs inputs,
                                   const Tensor<T>& output,
                                   const Tensor<T>& dJdy,
                                   LayerGradient<T>& gradient ) const
{
  const Tensor<T>& input = this->checked_input( inputs );
  check_shape( shape_of( output ), shape_of( dJdy ), "RectifiedLinear dJ/dy" );

  // no gradient flows through an inactive unit (an output of exactly zero counts as inactive)
  const Tensor<T> masked_dJdy = ( output.array() == T( 0 ) ).select( T( 0 ), dJdy.array() ).matrix();

  this->differentiate_affine( input, masked_dJdy, gradient );
}

/* Softmax */

template<std::floating_point T>
static const Tensor<T>& softmax_input( LayerInputs<T> inputs )
{
  const Tensor<T>& input = *inputs[0];
  if ( input.cols() != 1 or input.rows() == 0 ) {
    throw shape_mismatch_error( "Softmax input: expected a non-empty column vector, got "
                                + shape_of( input ).to_string() );
  }
  return input;
}

template<std::floating_point T>
void Softmax<T>::forward( Inputs inputs, Tensor<T>& output ) const
{
  this->check_arity( inputs );
  const Tensor<T>& input = softmax_input<T>( inputs );

  // subtract the maximum so the exponentials cannot overflow
  output = ( input.array() - input.maxCoeff() ).exp().matrix();
  output /= output.sum();
}

template<std::floating_point T>
void Softmax<T>::backward( Inputs inputs,
                           const Tensor<T>& output,
                           const Tensor<T>& dJdy,
                           LayerGradient<T>& gradient ) const
{
  this->check_arity( inputs );
  const Tensor<T>& input = softmax_input<T>( inputs );
  check_shape( shape_of( output ), shape_of( dJdy ), "Softmax dJ/dy" );
  check_shape( shape_of( input ), shape_of( output ), "Softmax output" );

  // The Jacobian is diag(y) - y y', so dJ/dx = y .* dJdy - (dJdy . y) y
  const T dJdy_dot_y = dJdy.cwiseProduct( output ).sum();

  gradient.inputs.resize( 1 );
  gradient.inputs[0] = ( output.array() * dJdy.array() - dJdy_dot_y * output.array() ).matrix();
  gradient.parameters.resize( 0, 0 );
}

/* Sum */

template<std::floating_point T>
Sum<T>::Sum( const size_t num_inputs )
  : num_inputs_( num_inputs )
{
  if ( num_inputs == 0 ) {
    throw validation_error( "Sum needs at least one input" );
  }
}

template<std::floating_point T>
void Sum<T>::forward( Inputs inputs, Tensor<T>& output ) const
{
  this->check_arity( inputs );

  output = *inputs[0];
  for ( size_t p = 1; p < inputs.size(); ++p ) {
    check_shape( shape_of( output ), shape_of( *inputs[p] ), "Sum input " + to_string( p ) );
    output += *inputs[p];
  }
}

template<std::floating_point T>
void Sum<T>::backward( Inputs inputs,
                       const Tensor<T>& output,
                       const Tensor<T>& dJdy,
                       LayerGradient<T>& gradient ) const
{
  this->check_arity( inputs );
  check_shape( shape_of( output ), shape_of( dJdy ), "Sum dJ/dy" );

  gradient.inputs.resize( inputs.size() );
  for ( auto& dJdx : gradient.inputs ) {
    dJdx = dJdy;
  }
  gradient.parameters.resize( 0, 0 );
}

template class Layer<float>;
template class Layer<double>;
template class ConstUnit<float>;
template class ConstUnit<double>;
template class Linear<float>;
template class Linear<double>;
template class RectifiedLinear<float>;
template class RectifiedLinear<double>;
template class Softmax<float>;
template class Softmax<double>;
template class Sum<float>;
template class Sum<double>;

template Tensor<float> glorot_uniform<float>( size_t, size_t, default_random_engine& );
template Tensor<double> glorot_uniform<double>( size_t, size_t, default_random_engine& );
