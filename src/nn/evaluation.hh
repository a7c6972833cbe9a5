#pragma once

#include <concepts>
#include <optional>
#include <ostream>
#include <vector>

#include "layer.hh"
#include "network.hh"

// NetworkEvaluation holds everything one evaluation of a Network produces:
// the output of each layer, and after gradient(), the gradient of the
// objective with respect to each layer's output, each layer's parameters,
// and the network input.
//
// It refers to (but does not own) the Network, which must outlive it.
// The buffers are sized once by allocate() and reused by every later
// evaluate()/gradient() call on inputs of the same shape.
//
// One NetworkEvaluation must only be used by one thread at a time.
template<std::floating_point T>
class NetworkEvaluation
{
public:
  NetworkEvaluation( const Network<T>& network );

  // Size every buffer for inputs shaped like sample_input, discarding any
  // previous allocation. Runs each layer that output_layer depends on once.
  void allocate( const Tensor<T>& sample_input, const size_t output_layer );
  void allocate( const Tensor<T>& sample_input ) { allocate( sample_input, network_.num_layers() ); }

  // Apply the network, caching the output of every layer on the way.
  // A layer feeding several consumers is computed once.
  // If a layer throws, the evaluation is left unallocated.
  const Tensor<T>& evaluate( const Tensor<T>& input, const size_t output_layer );
  const Tensor<T>& evaluate( const Tensor<T>& input ) { return evaluate( input, network_.num_layers() ); }

  // Backpropagate dJ/dy at the output layer (see backprop.hh)
  const ParameterSet<T>& gradient( const Tensor<T>& seed );

  // Read-only view of the underlying network's parameters. The network is
  // held by const reference, so updates go through Network::set_parameters()
  // and are picked up by the next evaluate().
  ParameterSet<T> parameters() const { return network_.parameters(); }

  // Accessors
  const Network<T>& network() const { return network_; }
  bool is_allocated() const { return input_.has_value(); }
  bool has_output( const size_t layer_no ) const;
  size_t output_layer() const;
  const Tensor<T>& input() const;
  const Tensor<T>& output() const { return output( output_layer() ); }
  const Tensor<T>& output( const size_t layer_no ) const;
  const Tensor<T>& dJdy( const size_t layer_no ) const;
  const Tensor<T>& dJdtheta( const size_t layer_no ) const;
  const ParameterSet<T>& dJdtheta() const { return dJdtheta_; }
  const Tensor<T>& dJdx() const;

  // Layers that the output depends on, highest number first
  const std::vector<size_t>& order() const { return order_; }

  // The forward inputs of a layer: the network input or other layers' outputs
  std::vector<const Tensor<T>*> layer_inputs( const size_t layer_no ) const;

  // Mutable access for the gradient engine
  Tensor<T>& mut_dJdy( const size_t layer_no );
  Tensor<T>& mut_dJdtheta( const size_t layer_no );
  Tensor<T>& mut_dJdx();
  LayerGradient<T>& mut_local_gradient( const size_t layer_no );

private:
  /* identity */
  const Network<T>& network_;

  /* cache, replaced by allocate() */
  std::optional<Tensor<T>> input_ {};
  size_t output_layer_ {};
  std::vector<size_t> order_ {};
  std::vector<std::optional<Tensor<T>>> outputs_ {};
  std::vector<std::optional<Tensor<T>>> dJdy_ {};
  ParameterSet<T> dJdtheta_ {};
  Tensor<T> dJdx_ {};
  std::vector<LayerGradient<T>> local_gradients_ {};

  void forward_pass();
  void check_allocated() const;
  void check_has_output( const size_t layer_no ) const;
};

// Make a NetworkEvaluation and allocate it for inputs shaped like sample_input
template<std::floating_point T>
NetworkEvaluation<T> allocate( const Network<T>& network, const Tensor<T>& sample_input, const size_t output_layer )
{
  NetworkEvaluation<T> evaluation { network };
  evaluation.allocate( sample_input, output_layer );
  return evaluation;
}

template<std::floating_point T>
NetworkEvaluation<T> allocate( const Network<T>& network, const Tensor<T>& sample_input )
{
  return allocate( network, sample_input, network.num_layers() );
}

// Prints the network and which layers the current output depends on
template<std::floating_point T>
std::ostream& operator<<( std::ostream& out, const NetworkEvaluation<T>& evaluation );
