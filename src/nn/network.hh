#pragma once

#include <concepts>
#include <memory>
#include <ostream>
#include <utility>
#include <vector>

#include "layer.hh"

// The Network models a directed acyclic graph of layers.
//
// Layers are numbered 1..num_layers(). connections( i ) lists, in input order,
// the layers whose outputs feed layer i; the number 0 stands for the network's
// own input. Every connection of layer i must name a layer numbered below i,
// which makes the graph acyclic and makes the numbering itself a topological
// order. This is checked when the Network is constructed.
//
// A Network owns its layers. It is not modified by evaluation, so any number of
// NetworkEvaluation objects (on any number of threads) can share it, as long as
// nobody calls set_parameters() at the same time.
template<std::floating_point T>
class Network
{
public:
  using LayerPtr = std::unique_ptr<Layer<T>>;
  using Connections = std::vector<std::vector<size_t>>;

  // General DAG
  Network( std::vector<LayerPtr>&& layers, Connections connections );

  // Sequential chain: each layer consumes the previous layer's output
  // (the first layer consumes the network input)
  explicit Network( std::vector<LayerPtr>&& layers );

  size_t num_layers() const { return layers_.size(); }

  const Layer<T>& layer( const size_t layer_no ) const;
  const std::vector<size_t>& connections( const size_t layer_no ) const;

  // One parameter blob per layer, in layer order
  ParameterSet<T> parameters() const;
  void set_parameters( const ParameterSet<T>& parameters );

  // Stateless evaluation. Nothing is cached, so a layer that feeds several
  // consumers is recomputed once per path. Fine for one-off inference;
  // use NetworkEvaluation for anything repeated.
  Tensor<T> evaluate( const Tensor<T>& input, const size_t output_layer ) const;
  Tensor<T> evaluate( const Tensor<T>& input ) const { return evaluate( input, num_layers() ); }
  Tensor<T> operator()( const Tensor<T>& input ) const { return evaluate( input ); }

  // The layers that output_layer depends on (itself included), highest number first.
  // Every consumer of a layer comes before it in this order.
  std::vector<size_t> reverse_topological_order( const size_t output_layer ) const;

  void check_layer_no( const size_t layer_no ) const;

private:
  std::vector<LayerPtr> layers_;
  Connections connections_;

  Tensor<T> evaluate_layer( const Tensor<T>& input, const size_t layer_no ) const;
};

template<std::floating_point T, class... Layers>
Network<T> make_sequential_network( std::unique_ptr<Layers>&&... layers )
{
  std::vector<std::unique_ptr<Layer<T>>> layer_list;
  layer_list.reserve( sizeof...( layers ) );
  ( layer_list.push_back( std::move( layers ) ), ... );
  return Network<T> { std::move( layer_list ) };
}

template<std::floating_point T>
std::ostream& operator<<( std::ostream& out, const Network<T>& network );
