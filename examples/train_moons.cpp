#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <micrograd/micrograd.hpp>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {
using micrograd::core::error::Error;
using micrograd::core::error::InvalidArgument;
using micrograd::core::error::Result;

struct TrainerConfig {
    std::size_t samples = 100;
    std::size_t epochs = 100;
    std::vector<std::size_t> hidden = {16, 16};
    float noise = 0.1f;
    std::uint32_t seed = 42;
    std::size_t log_every = 1;
    micrograd::log::Severity log_level = micrograd::log::Severity::Info;
};

template <typename T>
Result<T> parse_number(std::string_view flag, std::string_view text) {
    T value{};
    const auto [end, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);

    if (ec != std::errc{} || end != text.data() + text.size()) {
        return tl::unexpected(std::shared_ptr<Error>(new InvalidArgument(
            "Invalid value '{}' for {}", std::string(text),
            std::string(flag))));
    }

    return value;
}

Result<TrainerConfig> parse_args(int argc, char** argv) {
    TrainerConfig config;

    for (int i = 1; i < argc; ++i) {
        const std::string_view flag = argv[i];
        if (i + 1 >= argc) {
            return tl::unexpected(std::shared_ptr<Error>(new InvalidArgument(
                "Missing value for {}", std::string(flag))));
        }

        const std::string_view text = argv[++i];

        if (flag == "--epochs") {
            auto epochs = parse_number<std::size_t>(flag, text);
            if (!epochs)
                return tl::unexpected(epochs.error());
            config.epochs = *epochs;
        } else if (flag == "--samples") {
            auto samples = parse_number<std::size_t>(flag, text);
            if (!samples)
                return tl::unexpected(samples.error());
            config.samples = *samples;
        } else if (flag == "--seed") {
            auto seed = parse_number<std::uint32_t>(flag, text);
            if (!seed)
                return tl::unexpected(seed.error());
            config.seed = *seed;
        } else if (flag == "--log-level") {
            auto level = micrograd::log::parse_severity(text);
            if (!level)
                return tl::unexpected(level.error());
            config.log_level = *level;
        } else {
            return tl::unexpected(std::shared_ptr<Error>(
                new InvalidArgument("Unknown option {}", std::string(flag))));
        }
    }

    if (config.samples == 0 || config.epochs == 0) {
        return tl::unexpected(std::shared_ptr<Error>(new InvalidArgument(
            "--samples and --epochs must be positive")));
    }

    return config;
}

void train(const TrainerConfig& config) {
    std::mt19937 rng(config.seed);

    auto moons =
        micrograd::data::make_moons(config.samples, true, config.noise, rng);
    moons.labels = micrograd::data::to_signed_labels(moons.labels);

    std::vector<std::size_t> dims{2};
    dims.insert(dims.end(), config.hidden.begin(), config.hidden.end());
    dims.push_back(1);

    const micrograd::nn::MLP model(dims, rng);
    MICROGRAD_LOG_INFO("{}", model);
    MICROGRAD_LOG_INFO("Number of parameters: {}", model.parameters().size());
    MICROGRAD_LOG_INFO("Access policy: {}",
                       micrograd::autograd::DefaultPolicy::name);

    for (std::size_t epoch = 0; epoch < config.epochs; ++epoch) {
        const auto start = std::chrono::steady_clock::now();

        micrograd::data::shuffle_together(rng, moons.x1, moons.x2,
                                          moons.labels);

        auto outputs = micrograd::nn::forward_batch(model, moons.rows());
        std::vector<micrograd::Value> preds;
        preds.reserve(outputs.size());
        for (auto& output : outputs)
            preds.push_back(output.front());

        auto [loss, accuracy] =
            micrograd::nn::max_margin_loss(model, preds, moons.labels);

        model.zero_grad();
        loss.backward();

        const float learning_rate =
            1.0f - 0.9f * static_cast<float>(epoch) /
                       static_cast<float>(config.epochs);
        model.step(learning_rate);

        if (epoch % config.log_every == 0) {
            const auto elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
            MICROGRAD_LOG_INFO(
                "Epoch: {}, time: {}ms, loss: {:.6f}, accuracy: {:.4f}%",
                epoch, elapsed.count(), loss.value(), accuracy * 100.0f);
        }
    }
}
}  // namespace

int main(int argc, char** argv) {
    auto& logger = micrograd::log::global_logger();

    auto config = parse_args(argc, argv);
    if (!config) {
        MICROGRAD_LOG_ERROR("{}",
                            micrograd::core::error::format_error(
                                *config.error()));
        MICROGRAD_LOG_INFO(
            "Usage: {} [--epochs N] [--samples N] [--seed N] "
            "[--log-level trace|debug|info|warning|error|fatal]",
            argv[0]);
        logger.flush();
        return 1;
    }

    logger.set_min_severity(config->log_level);
    MICROGRAD_LOG_DEBUG("micrograd {} ({}, {}, {} build)",
                        MICROGRAD_VERSION_STRING, MICROGRAD_PLATFORM_NAME,
                        MICROGRAD_COMPILER_NAME, MICROGRAD_CONFIG_NAME);

    try {
        train(*config);
    } catch (const Error& e) {
        MICROGRAD_LOG_FATAL("{}", micrograd::core::error::format_error(e));
        logger.flush();
        return 1;
    }

    logger.flush();
    return 0;
}
