#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaEventExtractor.hpp"

using schedsync::infrastructure::GenerateRequest;
using schedsync::infrastructure::OllamaClient;
using schedsync::infrastructure::OllamaEventExtractor;
using json = nlohmann::json;

namespace {

const std::string kInterviewMail = "Your interview with Acme is on 2025-03-10 at 09:30.";

// Strict serialization throws on any invalid UTF-8, exactly as a request body would.
bool SerializesStrictly(const std::string& prompt) {
    try {
        json payload = {{"prompt", prompt}};
        payload.dump();
        return true;
    } catch (const json::type_error& e) {
        std::cerr << "[Test] " << e.what() << std::endl;
        return false;
    }
}

void TestCutKeepsCharactersWhole() {
    std::string longBody(3999, 'a');
    longBody += "\xC3\xA9 and more text after the limit";

    std::string prompt = OllamaEventExtractor::BuildPrompt({kInterviewMail, longBody});
    assert(SerializesStrictly(prompt));
    assert(prompt.find(kInterviewMail) != std::string::npos && "Healthy mail in the same batch is untouched.");
    assert(prompt.find("[truncated]") != std::string::npos);
    assert(prompt.find("and more text") == std::string::npos);
    std::cout << "[PASS] Long bodies are cut on a character boundary." << std::endl;
}

void TestLatin1BodyIsReplaced() {
    std::string prompt = OllamaEventExtractor::BuildPrompt({kInterviewMail, "Meet at the caf\xE9 on Friday"});
    assert(SerializesStrictly(prompt));
    assert(prompt.find(kInterviewMail) != std::string::npos);
    assert(prompt.find("Meet at the caf\xEF\xBF\xBD on Friday") != std::string::npos && "Bad byte becomes U+FFFD.");
    std::cout << "[PASS] Undecodable bytes are replaced." << std::endl;
}

void TestGenerateReportsInsteadOfThrowing() {
    // Nothing listens on port 1; the call must fail as a result, even with a raw Latin-1 prompt.
    OllamaClient client("127.0.0.1", 1, 1);
    GenerateRequest request;
    request.model = "none";
    request.prompt = "caf\xE9";
    auto result = client.generate(request);
    assert(!result.ok);
    assert(!result.error.empty());
    std::cout << "[PASS] generate() reports failures in its result." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting OllamaEventExtractor Test..." << std::endl;
    TestCutKeepsCharactersWhole();
    TestLatin1BodyIsReplaced();
    TestGenerateReportsInsteadOfThrowing();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
