#include <exception>
#include <iostream>
#include <string>
#include <torch/torch.h>
#include "../../../include/Tessel.h"

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "config/mnist.json";

    try {
        const auto run = Tessel::Config::load_run_config(config_path);
        auto [x_train, y_train, x_test, y_test] =
            Tessel::Data::Load::MNIST(run.dataset_root, run.train_fraction, run.test_fraction, true);

        Tessel::Model model(run.model);
        model.to_device(torch::cuda::is_available());
        model.set_optimizer(run.optimizer);
        model.set_loss(run.loss);

        auto options = Tessel::Config::train_options(run);
        options.validation = std::make_pair(x_test, y_test);
        model.train(x_train, y_train, options);

        model.evaluate(x_test, y_test, {.print_summary = true});

        // Resume: fresh model of the same shape, parameters from disk.
        Tessel::Checkpoint::save(model, run.checkpoint);
        Tessel::Model resumed(Tessel::Checkpoint::read_record(run.checkpoint).config);
        Tessel::Checkpoint::restore(run.checkpoint, resumed);
        resumed.to_device(torch::cuda::is_available());
        resumed.set_optimizer(run.optimizer);
        resumed.set_loss(run.loss);

        auto resume_options = Tessel::Config::train_options(run);
        resume_options.epoch = 1;
        resume_options.validation = std::make_pair(x_test, y_test);
        resumed.train(x_train, y_train, resume_options);
        resumed.evaluate(x_test, y_test, {.print_summary = true});
    } catch (const std::exception& error) {
        std::cerr << "[Tessel] " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
