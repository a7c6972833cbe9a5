#pragma once

#include <concepts>

#include "evaluation.hh"

// Reverse-mode differentiation of an evaluated network.
//
// Given dJ/dy at the output layer (the "seed"), compute dJ/dtheta for every
// layer and dJ/dx for the network input, storing them in the evaluation.
// Returns the list of parameter gradients, indexed like Network::parameters().
//
// Layers are processed in reverse-topological order, so a layer's dJ/dy has
// received the contribution of every consumer before the layer itself is
// differentiated.
template<std::floating_point T>
const ParameterSet<T>& gradient( NetworkEvaluation<T>& evaluation, const Tensor<T>& seed );

// Zero every gradient accumulator (except the output layer's dJ/dy, which
// receives the seed)
template<std::floating_point T>
void reset_gradients( NetworkEvaluation<T>& evaluation );

// Run one layer's backward step and add its results into the accumulators of
// its inputs and its parameters
template<std::floating_point T>
void backpropagate_layer( NetworkEvaluation<T>& evaluation, const size_t layer_no );
