#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <torch/torch.h>
#include "../../../include/Tessel.h"

namespace {
    const char* const kFashionLabels[10] = {
        "T-shirt/top", "Trouser", "Pullover", "Dress", "Coat",
        "Sandal", "Shirt", "Sneaker", "Bag", "Ankle boot"
    };
}

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "config/fashion_mnist.json";

    try {
        const auto run = Tessel::Config::load_run_config(config_path);
        auto [x_train, y_train, x_test, y_test] =
            Tessel::Data::Load::FashionMNIST(run.dataset_root, run.train_fraction, run.test_fraction, true);

        std::cout << "Train: " << x_train.sizes() << " | Test: " << x_test.sizes() << std::endl;

        Tessel::Model model(run.model);
        model.to_device(torch::cuda::is_available());
        model.set_optimizer(run.optimizer);
        model.set_loss(run.loss);

        auto options = Tessel::Config::train_options(run);
        options.validation = std::make_pair(x_test, y_test);
        const auto history = model.train(x_train, y_train, options);
        if (history.best_epoch) {
            std::cout << "Best epoch: " << *history.best_epoch << std::endl;
        }

        model.evaluate(x_test, y_test, {.print_summary = true});

        Tessel::Checkpoint::save(model, run.checkpoint);
        auto reloaded = Tessel::Checkpoint::load(run.checkpoint);
        reloaded->to_device(torch::cuda::is_available());

        const auto report = reloaded->evaluate(x_test, y_test);
        std::cout << "Reloaded accuracy: " << std::fixed << std::setprecision(4) << report.accuracy << std::endl;

        auto [probabilities, classes] = reloaded->predict_topk(x_test.narrow(0, 0, 1), 3);
        probabilities = probabilities.to(torch::kCPU);
        classes = classes.to(torch::kCPU);
        std::cout << "First test image, label " << kFashionLabels[y_test[0].item<int64_t>()] << ":" << std::endl;
        for (int64_t rank = 0; rank < classes.size(1); ++rank) {
            std::cout << "  " << kFashionLabels[classes[0][rank].item<int64_t>()] << "  "
                      << probabilities[0][rank].item<double>() << std::endl;
        }
    } catch (const std::exception& error) {
        std::cerr << "[Tessel] " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
