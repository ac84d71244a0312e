#pragma once
#include "types.h"

#include <string>
#include <vector>

namespace codebox {

// Builds the message lists sent to the model. The controller never formats
// prompt text itself.
class IPromptBuilder {
public:
    virtual ~IPromptBuilder() = default;

    // Script generation. `previous` is null on the first attempt.
    virtual std::vector<ChatMessage> code_prompt(const InvocationRequest& req,
                                                 const std::vector<std::string>& capabilities,
                                                 const AttemptFeedback* previous) = 0;

    // Single-token NONE / TOOLS routing question.
    virtual std::vector<ChatMessage> classifier_prompt(const InvocationRequest& req) = 0;

    // Plain-text answer without tools.
    virtual std::vector<ChatMessage> direct_prompt(const InvocationRequest& req,
                                                   const std::vector<std::string>& capabilities) = 0;
};

class DefaultPromptBuilder final : public IPromptBuilder {
public:
    // `base_system_prompt` is prepended to every system message (may be empty).
    explicit DefaultPromptBuilder(std::string base_system_prompt = "");

    std::vector<ChatMessage> code_prompt(const InvocationRequest& req,
                                         const std::vector<std::string>& capabilities,
                                         const AttemptFeedback* previous) override;
    std::vector<ChatMessage> classifier_prompt(const InvocationRequest& req) override;
    std::vector<ChatMessage> direct_prompt(const InvocationRequest& req,
                                           const std::vector<std::string>& capabilities) override;

private:
    std::string base_;

    std::string code_system(const std::vector<std::string>& capabilities) const;
};

// One-line usage hint for a vocabulary name, or "" when none is known.
std::string capability_signature(const std::string& name);

} // namespace codebox
