#include "Network.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <string>

// ====================================================================================================
// Constructor
// ====================================================================================================
Network::Network(size_t input_size, size_t hidden_size, size_t output_size,
                 double learning_rate, double weight_stddev,
                 std::optional<uint32_t> seed)
    : input_size(input_size), hidden_size(hidden_size), output_size(output_size),
      learning_rate(learning_rate),
      w1(input_size, std::vector<double>(hidden_size, 0.0)),
      w2(hidden_size, std::vector<double>(output_size, 0.0)),
      b1(hidden_size, 0.0),
      b2(output_size, 0.0) {

    if (input_size == 0 || hidden_size == 0 || output_size == 0) {
        throw std::invalid_argument("Network: dimensions must be non-zero");
    }
    if (!(learning_rate > 0.0)) {
        throw std::invalid_argument("Network: learning rate must be positive");
    }
    if (!(weight_stddev >= 0.0)) {
        throw std::invalid_argument("Network: weight spread must not be negative");
    }

    std::mt19937 gen(seed ? *seed : std::random_device{}());

    if (weight_stddev > 0.0) {
        std::normal_distribution<double> dist(0.0, weight_stddev);
        for (auto& row : w1) {
            for (double& w : row) w = dist(gen);
        }
        for (auto& row : w2) {
            for (double& w : row) w = dist(gen);
        }
    }
}

// ====================================================================================================
// Public Methods
// ====================================================================================================

double Network::sigmoid(double x) {
    x = std::clamp(x, -500.0, 500.0);
    return 1.0 / (1.0 + std::exp(-x));
}

Network::Activations Network::forward(const std::vector<double>& input) const {
    checkInput(input);

    Activations act;
    act.hidden.resize(hidden_size);
    act.output.resize(output_size);

    for (size_t j = 0; j < hidden_size; ++j) {
        double sum = 0.0;
        for (size_t i = 0; i < input_size; ++i) {
            sum += input[i] * w1[i][j];
        }
        act.hidden[j] = sigmoid(sum + b1[j]);
    }

    for (size_t k = 0; k < output_size; ++k) {
        double sum = 0.0;
        for (size_t j = 0; j < hidden_size; ++j) {
            sum += act.hidden[j] * w2[j][k];
        }
        act.output[k] = sigmoid(sum + b2[k]);
    }

    return act;
}

double Network::trainStep(const std::vector<double>& input, const std::vector<double>& targets) {
    if (targets.empty() || targets.size() > output_size) {
        throw DimensionMismatchError("Network: expected 1.." + std::to_string(output_size)
                                     + " targets, got " + std::to_string(targets.size()));
    }

    const Activations act = forward(input);
    const std::vector<double>& hidden = act.hidden;
    const std::vector<double>& output = act.output;

    // Pad short target vectors with their last element
    std::vector<double> t = targets;
    t.resize(output_size, targets.back());

    // -------------------------------------------------------
    // Error terms
    // -------------------------------------------------------
    std::vector<double> errors_out(output_size);
    for (size_t k = 0; k < output_size; ++k) {
        const double o = output[k];
        errors_out[k] = o * (1.0 - o) * (t[k] - o);
    }

    // Uses w2 before it is updated below
    std::vector<double> errors_hidden(hidden_size);
    for (size_t j = 0; j < hidden_size; ++j) {
        double sum = 0.0;
        for (size_t k = 0; k < output_size; ++k) {
            sum += errors_out[k] * w2[j][k];
        }
        const double h = hidden[j];
        errors_hidden[j] = h * (1.0 - h) * sum;
    }

    // -------------------------------------------------------
    // Weight updates
    // -------------------------------------------------------
    for (size_t j = 0; j < hidden_size; ++j) {
        for (size_t k = 0; k < output_size; ++k) {
            w2[j][k] += learning_rate * errors_out[k] * hidden[j];
        }
    }
    for (size_t i = 0; i < input_size; ++i) {
        for (size_t j = 0; j < hidden_size; ++j) {
            w1[i][j] += learning_rate * errors_hidden[j] * input[i];
        }
    }
    for (size_t k = 0; k < output_size; ++k) {
        b2[k] += learning_rate * errors_out[k];
    }
    for (size_t j = 0; j < hidden_size; ++j) {
        b1[j] += learning_rate * errors_hidden[j];
    }

    double loss = 0.0;
    for (size_t k = 0; k < output_size; ++k) {
        const double d = t[k] - output[k];
        loss += d * d;
    }
    return loss / static_cast<double>(output_size);
}

std::vector<double> Network::predict(const std::vector<double>& input) const {
    return forward(input).output;
}

bool Network::isFinite() const {
    auto finite = [](double v) { return std::isfinite(v); };
    for (const auto& row : w1) {
        if (!std::all_of(row.begin(), row.end(), finite)) return false;
    }
    for (const auto& row : w2) {
        if (!std::all_of(row.begin(), row.end(), finite)) return false;
    }
    return std::all_of(b1.begin(), b1.end(), finite)
        && std::all_of(b2.begin(), b2.end(), finite);
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

void Network::checkInput(const std::vector<double>& input) const {
    if (input.size() != input_size) {
        throw DimensionMismatchError("Network: expected input of length " + std::to_string(input_size)
                                     + ", got " + std::to_string(input.size()));
    }
}
