#pragma once

#include <Eigen/Dense>
#include <concepts>
#include <cstddef>
#include <random>
#include <span>
#include <string_view>
#include <vector>

#include "tensor.hh"

// The forward inputs of a layer, in connection order. The pointers refer to
// buffers owned by whoever runs the layer (usually a NetworkEvaluation).
template<std::floating_point T>
using LayerInputs = std::span<const Tensor<T>* const>;

// What one backward step produces: the gradient of the objective with respect
// to each forward input, and with respect to the layer's own parameters.
// The buffers are reused across calls when their shapes do not change.
template<std::floating_point T>
struct LayerGradient
{
  std::vector<Tensor<T>> inputs {};
  Tensor<T> parameters {};
};

// The Layer class models one differentiable unit of a network.
// It has a forward transform, a backward (gradient) transform, and a
// parameter blob that can be read or replaced as a whole.
// Layers don't know which other layers feed them; that's the Network's job.
template<std::floating_point T>
class Layer
{
public:
  using Inputs = LayerInputs<T>;

  virtual ~Layer() = default;

  virtual std::string_view name() const { return "Layer"; }

  // How many forward inputs the layer consumes
  virtual size_t num_inputs() const { return 1; }

  // Compute the output from the forward inputs. The output buffer is reused
  // when it already has the right shape.
  virtual void forward( Inputs inputs, Tensor<T>& output ) const;

  // Given the forward inputs, the cached forward output, and dJ/dy,
  // write dJ/dx for every input and dJ/dtheta into "gradient".
  virtual void backward( Inputs inputs,
                         const Tensor<T>& output,
                         const Tensor<T>& dJdy,
                         LayerGradient<T>& gradient ) const;

  // Parameter accessors (empty for parameter-free layers)
  virtual Tensor<T> parameters() const { return {}; }
  virtual void set_parameters( const Tensor<T>& parameters );
  virtual Shape parameter_shape() const { return { 0, 0 }; }

protected:
  void check_arity( Inputs inputs ) const;
};

// Glorot/Xavier uniform initialization: each entry drawn uniformly from
// [-sqrt(6/(rows+cols)), +sqrt(6/(rows+cols))]
template<std::floating_point T>
Tensor<T> glorot_uniform( size_t rows, size_t cols, std::default_random_engine& prng );

// Outputs a constant value, which is also its parameter
template<std::floating_point T>
class ConstUnit : public Layer<T>
{
public:
  using Inputs = typename Layer<T>::Inputs;

  ConstUnit( const Tensor<T>& value );

  std::string_view name() const override { return "ConstUnit"; }
  size_t num_inputs() const override { return 0; }

  void forward( Inputs inputs, Tensor<T>& output ) const override;
  void backward( Inputs inputs,
                 const Tensor<T>& output,
                 const Tensor<T>& dJdy,
                 LayerGradient<T>& gradient ) const override;

  Tensor<T> parameters() const override { return value_; }
  void set_parameters( const Tensor<T>& parameters ) override;
  Shape parameter_shape() const override { return shape_of( value_ ); }

private:
  Tensor<T> value_;
};

// Fully-connected layer, y = W x + b.
// The parameters are packed as one (outputs x (inputs+1)) matrix [W | b].
template<std::floating_point T>
class Linear : public Layer<T>
{
public:
  using Inputs = typename Layer<T>::Inputs;

  Linear( const Tensor<T>& weights, const Tensor<T>& biases );

  // Glorot-initialized weights, zero biases
  Linear( size_t input_size, size_t output_size, std::default_random_engine& prng );
  Linear( size_t input_size, size_t output_size );

  std::string_view name() const override { return "Linear"; }

  void forward( Inputs inputs, Tensor<T>& output ) const override;
  void backward( Inputs inputs,
                 const Tensor<T>& output,
                 const Tensor<T>& dJdy,
                 LayerGradient<T>& gradient ) const override;

  Tensor<T> parameters() const override { return weights_and_biases_; }
  void set_parameters( const Tensor<T>& parameters ) override;
  Shape parameter_shape() const override { return shape_of( weights_and_biases_ ); }

  Eigen::Index input_size() const { return weights_and_biases_.cols() - 1; }
  Eigen::Index output_size() const { return weights_and_biases_.rows(); }

  auto weights() const { return weights_and_biases_.leftCols( input_size() ); }
  auto biases() const { return weights_and_biases_.rightCols( 1 ); }

protected:
  // z = W x + b
  void apply_affine( const Tensor<T>& input, Tensor<T>& output ) const;

  // dJ/dx = W' dJ/dz, dJ/dtheta = [ dJ/dz x' | dJ/dz ]
  void differentiate_affine( const Tensor<T>& input, const Tensor<T>& dJdz, LayerGradient<T>& gradient ) const;

  const Tensor<T>& checked_input( Inputs inputs ) const;

private:
  Tensor<T> weights_and_biases_;
};

// Fully-connected layer with a rectifier, y = max(0, W x + b)
template<std::floating_point T>
class RectifiedLinear : public Linear<T>
{
public:
  using Inputs = typename Layer<T>::Inputs;
  using Linear<T>::Linear;

  std::string_view name() const override { return "RectifiedLinear"; }

  void forward( Inputs inputs, Tensor<T>& output ) const override;
  void backward( Inputs inputs,
                 const Tensor<T>& output,
                 const Tensor<T>& dJdy,
                 LayerGradient<T>& gradient ) const override;
};

// Maps a vector to a probability vector. No parameters.
template<std::floating_point T>
class Softmax : public Layer<T>
{
public:
  using Inputs = typename Layer<T>::Inputs;

  std::string_view name() const override { return "Softmax"; }

  void forward( Inputs inputs, Tensor<T>& output ) const override;
  void backward( Inputs inputs,
                 const Tensor<T>& output,
                 const Tensor<T>& dJdy,
                 LayerGradient<T>& gradient ) const override;
};

// Element-wise sum of several equally shaped inputs. No parameters.
// This is what lets branches of a network merge again.
template<std::floating_point T>
class Sum : public Layer<T>
{
public:
  using Inputs = typename Layer<T>::Inputs;

  Sum( size_t num_inputs );

  std::string_view name() const override { return "Sum"; }
  size_t num_inputs() const override { return num_inputs_; }

  void forward( Inputs inputs, Tensor<T>& output ) const override;
  void backward( Inputs inputs,
                 const Tensor<T>& output,
                 const Tensor<T>& dJdy,
                 LayerGradient<T>& gradient ) const override;

private:
  size_t num_inputs_;
};
