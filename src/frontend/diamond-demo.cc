#include "backprop.hh"
#include "evaluation.hh"
#include "network.hh"
#include "random.hh"

#include <charconv>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace std;

// Trains a small network with a fan-out ("diamond") shape to tell whether a
// point lies inside the unit circle. The update rule is plain stochastic
// gradient descent, written here rather than in the engine.

using Datum = pair<Tensor<float>, size_t>;

static constexpr size_t num_data_points = 2000;
static constexpr float learning_rate = 0.05;
static constexpr size_t default_iterations = 20000;

Network<float> make_diamond_classifier( default_random_engine& prng )
{
  vector<unique_ptr<Layer<float>>> layers;
  layers.push_back( make_unique<RectifiedLinear<float>>( 2, 16, prng ) ); /* 1 */
  layers.push_back( make_unique<RectifiedLinear<float>>( 16, 8, prng ) ); /* 2 */
  layers.push_back( make_unique<Linear<float>>( 16, 8, prng ) );          /* 3 */
  layers.push_back( make_unique<Sum<float>>( 2 ) );                       /* 4 */
  layers.push_back( make_unique<Linear<float>>( 8, 2, prng ) );           /* 5 */
  layers.push_back( make_unique<Softmax<float>>() );                      /* 6 */

  return Network<float> { move( layers ), { { 0 }, { 1 }, { 1 }, { 2, 3 }, { 4 }, { 5 } } };
}

vector<Datum> make_dataset( default_random_engine& prng )
{
  uniform_real_distribution<float> coordinate { -1.5, 1.5 };

  vector<Datum> ret;
  for ( size_t i = 0; i < num_data_points; ++i ) {
    Tensor<float> point( 2, 1 );
    point << coordinate( prng ), coordinate( prng );
    ret.emplace_back( point, point.norm() < 1 ? 1 : 0 );
  }
  return ret;
}

// Cross-entropy of the predicted probabilities against the true class
float cross_entropy( const Tensor<float>& probabilities, const size_t label )
{
  return -log( probabilities( label ) );
}

Tensor<float> pd_cross_entropy_wrt_probabilities( const Tensor<float>& probabilities, const size_t label )
{
  Tensor<float> ret = Tensor<float>::Zero( probabilities.rows(), 1 );
  ret( label ) = -1 / probabilities( label );
  return ret;
}

pair<float, float> loss_and_accuracy( NetworkEvaluation<float>& evaluation, const vector<Datum>& data )
{
  float total_loss = 0;
  size_t correct = 0;
  for ( const auto& [x, label] : data ) {
    const Tensor<float>& probabilities = evaluation.evaluate( x );
    total_loss += cross_entropy( probabilities, label );
    Eigen::Index predicted;
    probabilities.col( 0 ).maxCoeff( &predicted );
    correct += static_cast<size_t>( predicted ) == label;
  }
  return { total_loss / data.size(), float( correct ) / data.size() };
}

void program_body( const size_t iterations )
{
  ios::sync_with_stdio( false );

  auto prng = get_random_engine();
  Network<float> nn = make_diamond_classifier( prng );
  const vector<Datum> data = make_dataset( prng );

  const size_t split = data.size() * 3 / 4;
  const vector<Datum> training_data( data.begin(), data.begin() + split );
  const vector<Datum> test_data( data.begin() + split, data.end() );

  NetworkEvaluation<float> evaluation { nn };
  evaluation.allocate( training_data.front().first );

  cout << nn << endl;
  cout << fixed << setprecision( 4 );

  auto [loss_before, accuracy_before] = loss_and_accuracy( evaluation, test_data );
  cout << "\tLoss before: " << loss_before << " (accuracy " << accuracy_before * 100 << "%)" << endl;

  uniform_int_distribution<size_t> pick { 0, training_data.size() - 1 };
  for ( size_t i = 0; i < iterations; ++i ) {
    const auto& [x, label] = training_data.at( pick( prng ) );

    const Tensor<float>& probabilities = evaluation.evaluate( x );
    const ParameterSet<float>& gradients
      = gradient( evaluation, pd_cross_entropy_wrt_probabilities( probabilities, label ) );

    ParameterSet<float> parameters = nn.parameters();
    for ( size_t layer = 0; layer < parameters.size(); ++layer ) {
      parameters[layer] -= learning_rate * gradients[layer];
    }
    nn.set_parameters( parameters );
  }

  auto [loss_after, accuracy_after] = loss_and_accuracy( evaluation, test_data );
  cout << "\tLoss after:  " << loss_after << " (accuracy " << accuracy_after * 100 << "%)" << endl;
}

int main( int argc, char* argv[] )
{
  if ( argc < 0 ) {
    abort();
  }

  if ( argc > 2 ) {
    cerr << "Usage: " << argv[0] << " [iterations]\n";
    return EXIT_FAILURE;
  }

  size_t iterations = default_iterations;
  if ( argc == 2 ) {
    const string_view arg { argv[1] };
    const auto [ptr, ec] = from_chars( arg.data(), arg.data() + arg.size(), iterations );
    if ( ec != errc {} or ptr != arg.data() + arg.size() ) {
      cerr << "Usage: " << argv[0] << " [iterations]\n";
      return EXIT_FAILURE;
    }
  }

  try {
    program_body( iterations );
  } catch ( const exception& e ) {
    cerr << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
