#include "backprop.hh"
#include "evaluation.hh"
#include "gradient_check.hh"
#include "network.hh"

#include <iostream>
#include <memory>

using namespace std;

using LayerPtr = unique_ptr<Layer<double>>;

void one_layer_network_test( RandomState& rng )
{
  auto network = make_sequential_network<double>( make_unique<Linear<double>>( 1, 1, rng.prng ) );
  check_network_gradients( "one_layer_network_test", network, rng.tensor( 1, 1 ), rng );
  report_passed( "one_layer_network_test" );
}

void multi_layer_network_test( RandomState& rng )
{
  auto network = make_sequential_network<double>( make_unique<RectifiedLinear<double>>( 4, 16, rng.prng ),
                                                   make_unique<RectifiedLinear<double>>( 16, 16, rng.prng ),
                                                   make_unique<RectifiedLinear<double>>( 16, 16, rng.prng ),
                                                   make_unique<Linear<double>>( 16, 3, rng.prng ) );
  check_network_gradients( "multi_layer_network_test", network, rng.tensor( 4, 1 ), rng );
  report_passed( "multi_layer_network_test" );
}

void classifier_network_test( RandomState& rng )
{
  auto network = make_sequential_network<double>( make_unique<RectifiedLinear<double>>( 3, 8, rng.prng ),
                                                  make_unique<Linear<double>>( 8, 5, rng.prng ),
                                                  make_unique<Softmax<double>>() );
  check_network_gradients( "classifier_network_test", network, rng.tensor( 3, 1 ), rng );
  report_passed( "classifier_network_test" );
}

// The output of a sequential network is the composition of its layers
void sequential_composition_test( RandomState& rng )
{
  const string title = "sequential_composition_test";

  vector<LayerPtr> layers;
  layers.push_back( make_unique<RectifiedLinear<double>>( 5, 7, rng.prng ) );
  layers.push_back( make_unique<Linear<double>>( 7, 6, rng.prng ) );
  layers.push_back( make_unique<RectifiedLinear<double>>( 6, 4, rng.prng ) );
  layers.push_back( make_unique<Softmax<double>>() );
  Network<double> network { move( layers ) };

  const Tensor<double> x = rng.tensor( 5, 1 );

  Tensor<double> value = x;
  for ( size_t layer_no = 1; layer_no <= network.num_layers(); ++layer_no ) {
    Tensor<double> next;
    network.layer( layer_no ).forward( vector<const Tensor<double>*> { &value }, next );
    value = next;
  }

  NetworkEvaluation<double> evaluation { network };
  if ( network.evaluate( x ) != value or evaluation.evaluate( x ) != value ) {
    throw check_failed( title, "network output differs from composing its layers" );
  }

  report_passed( title );
}

// Layer 1 feeds layers 2 and 3, which both feed layer 4. The gradient at
// layer 1 must be the sum over both paths.
Network<double> make_diamond( RandomState& rng )
{
  vector<LayerPtr> layers;
  layers.push_back( make_unique<RectifiedLinear<double>>( 3, 6, rng.prng ) ); /* 1 */
  layers.push_back( make_unique<Linear<double>>( 6, 4, rng.prng ) );          /* 2 */
  layers.push_back( make_unique<RectifiedLinear<double>>( 6, 4, rng.prng ) ); /* 3 */
  layers.push_back( make_unique<Sum<double>>( 2 ) );                          /* 4 */
  layers.push_back( make_unique<Softmax<double>>() );                         /* 5 */

  return Network<double> { move( layers ), { { 0 }, { 1 }, { 1 }, { 2, 3 }, { 4 } } };
}

void diamond_network_test( RandomState& rng )
{
  const string title = "diamond_network_test";
  auto network = make_diamond( rng );
  const Tensor<double> x = rng.tensor( 3, 1 );

  check_network_gradients( title, network, x, rng );

  /* layer 1's dJ/dy is exactly what its two consumers hand back */
  NetworkEvaluation<double> evaluation { network };
  const Tensor<double> output = evaluation.evaluate( x );
  evaluation.gradient( rng.tensor( output.rows(), output.cols() ) );

  Tensor<double> expected = Tensor<double>::Zero( 6, 1 );
  for ( const size_t consumer : { 2, 3 } ) {
    LayerGradient<double> local;
    network.layer( consumer ).backward( evaluation.layer_inputs( consumer ),
                                        evaluation.output( consumer ),
                                        evaluation.dJdy( consumer ),
                                        local );
    expected += local.inputs.at( 0 );
  }

  if ( ( evaluation.dJdy( 1 ) - expected ).cwiseAbs().maxCoeff() > 1e-12 ) {
    throw check_failed( title, "dJ/dy at the fan-out layer is not the sum over its consumers" );
  }

  report_passed( title );
}

// Skip connections: the network input and an early layer feed a late layer
void skip_connection_test( RandomState& rng )
{
  vector<LayerPtr> layers;
  layers.push_back( make_unique<RectifiedLinear<double>>( 4, 4, rng.prng ) ); /* 1 */
  layers.push_back( make_unique<RectifiedLinear<double>>( 4, 4, rng.prng ) ); /* 2 */
  layers.push_back( make_unique<Linear<double>>( 4, 4, rng.prng ) );          /* 3 */
  layers.push_back( make_unique<Sum<double>>( 3 ) );                          /* 4 */
  layers.push_back( make_unique<Linear<double>>( 4, 2, rng.prng ) );          /* 5 */

  Network<double> network { move( layers ), { { 0 }, { 1 }, { 2 }, { 0, 1, 3 }, { 4 } } };
  check_network_gradients( "skip_connection_test", network, rng.tensor( 4, 1 ), rng );
  report_passed( "skip_connection_test" );
}

// A ConstUnit acts as a learnable bias vector added to the rest of the network
void const_unit_network_test( RandomState& rng )
{
  vector<LayerPtr> layers;
  layers.push_back( make_unique<ConstUnit<double>>( rng.tensor( 3, 1 ) ) );   /* 1 */
  layers.push_back( make_unique<RectifiedLinear<double>>( 2, 3, rng.prng ) ); /* 2 */
  layers.push_back( make_unique<Sum<double>>( 2 ) );                          /* 3 */
  layers.push_back( make_unique<Softmax<double>>() );                         /* 4 */

  Network<double> network { move( layers ), { {}, { 0 }, { 1, 2 }, { 3 } } };
  check_network_gradients( "const_unit_network_test", network, rng.tensor( 2, 1 ), rng );
  report_passed( "const_unit_network_test" );
}

// Differentiating with respect to an intermediate layer leaves the layers
// after it with zero gradients
void intermediate_output_test( RandomState& rng )
{
  const string title = "intermediate_output_test";
  auto network = make_diamond( rng );
  const Tensor<double> x = rng.tensor( 3, 1 );

  NetworkEvaluation<double> evaluation { network };
  const Tensor<double> y2 = evaluation.evaluate( x, 2 );
  if ( y2 != network.evaluate( x, 2 ) ) {
    throw check_failed( title, "intermediate output differs from stateless evaluation" );
  }
  if ( evaluation.has_output( 3 ) or evaluation.has_output( 5 ) ) {
    throw check_failed( title, "layers the output does not depend on were evaluated" );
  }

  const ParameterSet<double>& dJdtheta = evaluation.gradient( Tensor<double>::Ones( 4, 1 ) );
  if ( dJdtheta.size() != network.num_layers() ) {
    throw check_failed( title, "parameter gradient list does not line up with the layers" );
  }
  if ( not dJdtheta.at( 2 ).isZero() or dJdtheta.at( 2 ).rows() != 4 ) {
    throw check_failed( title, "layer 3 has a non-zero gradient" );
  }
  if ( dJdtheta.at( 0 ).isZero() ) {
    throw check_failed( title, "layer 1 has no gradient" );
  }

  report_passed( title );
}

void program_body()
{
  ios::sync_with_stdio( false );

  // set random seed for test stability
  RandomState rng;
  rng.prng.seed( 20221007 );

  one_layer_network_test( rng );
  multi_layer_network_test( rng );
  classifier_network_test( rng );
  sequential_composition_test( rng );
  diamond_network_test( rng );
  skip_connection_test( rng );
  const_unit_network_test( rng );
  intermediate_output_test( rng );
}

int main( int argc, char* argv[] )
{
  if ( argc < 0 ) {
    abort();
  }

  if ( argc != 1 ) {
    cerr << "Usage: " << argv[0] << "\n";
    return EXIT_FAILURE;
  }

  try {
    program_body();
  } catch ( const exception& e ) {
    cerr << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
