#ifndef NETWORK_HPP
#define NETWORK_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

/**
 * Thrown when a vector handed to the Network does not match its dimensions
 */
class DimensionMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * Network - Two-layer feed-forward network with sigmoid activations
 *
 * input (N) -> hidden (H) -> output (O), trained one example at a time by
 * back-propagation with a fixed learning rate. No momentum, no decay.
 *
 * Not thread-safe: trainStep mutates the weights in place.
 */
class Network {
public:
    struct Activations {
        std::vector<double> hidden;
        std::vector<double> output;
    };

    /**
     * Constructor - allocates weights and draws them from N(0, weight_stddev)
     *
     * Biases start at zero.
     *
     * @param input_size N
     * @param hidden_size H
     * @param output_size O
     * @param learning_rate Step size used by trainStep
     * @param weight_stddev Standard deviation of the initial weights
     * @param seed RNG seed; std::random_device is used when absent
     */
    Network(size_t input_size, size_t hidden_size, size_t output_size,
            double learning_rate = 0.15, double weight_stddev = 0.5,
            std::optional<uint32_t> seed = std::nullopt);

    /**
     * Forward pass
     * @param input Feature vector of length N
     * @return Hidden (H) and output (O) activations, each in (0, 1)
     */
    Activations forward(const std::vector<double>& input) const;

    /**
     * One back-propagation step towards targets
     *
     * Targets shorter than O are padded by repeating the last element.
     *
     * @param input Feature vector of length N
     * @param targets 1..O target values
     * @return Mean squared error of the pre-update forward pass
     */
    double trainStep(const std::vector<double>& input, const std::vector<double>& targets);

    /**
     * Forward pass, output layer only
     */
    std::vector<double> predict(const std::vector<double>& input) const;

    size_t inputSize() const { return input_size; }
    size_t hiddenSize() const { return hidden_size; }
    size_t outputSize() const { return output_size; }
    double learningRate() const { return learning_rate; }

    /**
     * true if every weight and bias is a finite number
     */
    bool isFinite() const;

    /**
     * Logistic function with the argument clamped to [-500, 500]
     */
    static double sigmoid(double x);

private:
    size_t input_size;
    size_t hidden_size;
    size_t output_size;
    double learning_rate;

    std::vector<std::vector<double>> w1;  // [input][hidden]
    std::vector<std::vector<double>> w2;  // [hidden][output]
    std::vector<double> b1;
    std::vector<double> b2;

    void checkInput(const std::vector<double>& input) const;
};

#endif // NETWORK_HPP
