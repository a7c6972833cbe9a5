#include "backprop.hh"
#include "exception.hh"

#include <stdexcept>
#include <string>

using namespace std;

template<std::floating_point T>
void reset_gradients( NetworkEvaluation<T>& evaluation )
{
  const size_t output_layer = evaluation.output_layer();

  for ( const size_t layer_no : evaluation.order() ) {
    if ( layer_no != output_layer ) {
      evaluation.mut_dJdy( layer_no ).setZero();
    }
  }

  for ( size_t layer_no = 1; layer_no <= evaluation.network().num_layers(); ++layer_no ) {
    evaluation.mut_dJdtheta( layer_no ).setZero();
  }

  evaluation.mut_dJdx().setZero();
}

template<std::floating_point T>
void backpropagate_layer( NetworkEvaluation<T>& evaluation, const size_t layer_no )
{
  const Network<T>& network = evaluation.network();
  const auto& connections = network.connections( layer_no );

  LayerGradient<T>& local = evaluation.mut_local_gradient( layer_no );
  network.layer( layer_no ).backward(
    evaluation.layer_inputs( layer_no ), evaluation.output( layer_no ), evaluation.dJdy( layer_no ), local );

  if ( local.inputs.size() != connections.size() ) {
    throw runtime_error( "layer " + to_string( layer_no ) + " produced " + to_string( local.inputs.size() )
                         + " input gradients for " + to_string( connections.size() ) + " inputs" );
  }

  /* add, never overwrite: a layer with several consumers gets one contribution from each */
  for ( size_t p = 0; p < connections.size(); ++p ) {
    const size_t input_no = connections[p];
    Tensor<T>& accumulator = input_no == 0 ? evaluation.mut_dJdx() : evaluation.mut_dJdy( input_no );
    check_shape( shape_of( accumulator ),
                 shape_of( local.inputs[p] ),
                 "gradient from layer " + to_string( layer_no ) + " to input " + to_string( input_no ) );
    accumulator += local.inputs[p];
  }

  Tensor<T>& dJdtheta = evaluation.mut_dJdtheta( layer_no );
  check_shape( shape_of( dJdtheta ),
               shape_of( local.parameters ),
               "parameter gradient of layer " + to_string( layer_no ) );
  dJdtheta += local.parameters;
}

template<std::floating_point T>
const ParameterSet<T>& gradient( NetworkEvaluation<T>& evaluation, const Tensor<T>& seed )
{
  if ( not evaluation.is_allocated() ) {
    throw runtime_error( "gradient requested before the network was evaluated" );
  }

  const size_t output_layer = evaluation.output_layer();
  check_shape( shape_of( evaluation.output() ), shape_of( seed ), "seed gradient" );

  reset_gradients( evaluation );
  evaluation.mut_dJdy( output_layer ) = seed;

  /* order() is highest layer first; every consumer of a layer has a higher number */
  for ( const size_t layer_no : evaluation.order() ) {
    backpropagate_layer( evaluation, layer_no );
  }

  return evaluation.dJdtheta();
}

template void reset_gradients<float>( NetworkEvaluation<float>& );
template void reset_gradients<double>( NetworkEvaluation<double>& );

template void backpropagate_layer<float>( NetworkEvaluation<float>&, size_t );
template void backpropagate_layer<double>( NetworkEvaluation<double>&, size_t );

template const ParameterSet<float>& gradient<float>( NetworkEvaluation<float>&, const Tensor<float>& );
template const ParameterSet<double>& gradient<double>( NetworkEvaluation<double>&, const Tensor<double>& );
