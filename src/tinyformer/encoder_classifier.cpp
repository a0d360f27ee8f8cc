#include "tinyformer/encoder_classifier.h"
#include "tinyformer/greedy_decoder.h"
#include "tinyformer/errors.h"
#include <string>

namespace tinyformer {

namespace {

int validated_classes(int num_classes) {
    if (num_classes < 2) {
        throw InvalidConfigError("num_classes must be >= 2, got " + std::to_string(num_classes));
    }
    return num_classes;
}

}

EncoderClassifier::EncoderClassifier(const ModelConfig& config, int num_classes) :
    SequenceModel(config),
    num_classes(validated_classes(num_classes)),
    init_rng(config.seed),
    encoder(config.vocab_size, config.d_model, config.max_len, config.num_heads, init_rng),
    classifier_head(config.d_model, num_classes, init_rng)
{
    registerModule(encoder);
    registerModule(classifier_head);
}

std::shared_ptr<Variable> EncoderClassifier::forward(const std::vector<int>& tokens) const {
    auto encoded = encoder.forward(tokens);

    const size_t seq_len = encoded->getData().getRows();
    Tensor mean_weights(1, seq_len);
    mean_weights.fill(1.0f / seq_len);
    auto pooled = Variable::create(mean_weights, false)->matmul(encoded);

    return classifier_head.forward(pooled);
}

int EncoderClassifier::predict(const std::vector<int>& tokens) const {
    return argmax_row(forward(tokens)->getData(), 0);
}

std::shared_ptr<Variable> EncoderClassifier::loss(const std::vector<int>& tokens, int label) const {
    return forward(tokens)->log_softmax()->nll_loss({label});
}

std::shared_ptr<Variable> EncoderClassifier::loss(const Example& example) const {
    if (example.labels.size() != 1) {
        throw ShapeError("Classifier example needs exactly one label, got " +
                         std::to_string(example.labels.size()));
    }
    return loss(example.input, example.labels[0]);
}

} // namespace tinyformer
