#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include "core/cache/persistent/ResponseFingerprint.hpp"

using fanws::core::cache::ContextFingerprint;
using fanws::core::cache::PromptContext;
using fanws::core::cache::RequestDescriptor;

namespace {

RequestDescriptor makeRequest() {
    RequestDescriptor request;
    request.provider = "openai";
    request.endpoint = "/chat/completions";
    request.parameters = {{"model", "gpt-4"}, {"prompt", "Write chapter 3"}, {"max_tokens", 2000}};
    return request;
}

PromptContext makeContext() {
    PromptContext context;
    context.projectName = "Winter Tales";
    context.genre = "fantasy";
    context.style = "lyrical";
    context.characters = {"Ari", "Bren"};
    context.recentContent = "The snow fell quietly over the northern pass.";
    context.outline = "Act I: departure. Act II: the pass. Act III: return.";
    return context;
}

bool isHex(const std::string& value) {
    return value.find_first_not_of("0123456789abcdef") == std::string::npos;
}

} // namespace

void smokeTestResponseFingerprint() {
    ContextFingerprint fingerprint;
    const auto request = makeRequest();
    const auto context = makeContext();

    const auto key = fingerprint.compute(request, context);
    assert(key.size() == 64);
    assert(isHex(key));
    assert(key == fingerprint.compute(request, context));

    // Порядок параметров не влияет на ключ
    RequestDescriptor reordered = request;
    reordered.parameters = nlohmann::json::object();
    reordered.parameters["max_tokens"] = 2000;
    reordered.parameters["prompt"] = "Write chapter 3";
    reordered.parameters["model"] = "gpt-4";
    assert(fingerprint.compute(reordered, context) == key);

    assert(ContextFingerprint::sha256Hex("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    std::cout << "[OK] ResponseFingerprint smoke test\n";
}

void contextSensitivityTestResponseFingerprint() {
    ContextFingerprint fingerprint;
    const auto request = makeRequest();
    const auto base = makeContext();
    const auto key = fingerprint.compute(request, base);

    std::set<std::string> keys{key};
    auto changed = base;
    changed.genre = "horror";
    keys.insert(fingerprint.compute(request, changed));
    changed = base;
    changed.characters.push_back("Cato");
    keys.insert(fingerprint.compute(request, changed));
    changed = base;
    changed.recentContent += " A wolf howled.";
    keys.insert(fingerprint.compute(request, changed));
    changed = base;
    changed.outline = "Act I: arrival.";
    keys.insert(fingerprint.compute(request, changed));
    auto otherRequest = request;
    otherRequest.provider = "anthropic";
    keys.insert(fingerprint.compute(otherRequest, base));
    assert(keys.size() == 6);

    // Изменение вне подставляемого фрагмента ключ не меняет
    auto longContext = base;
    longContext.recentContent = std::string(1000, 'x') + std::string(500, 'y');
    auto earlyEdit = longContext;
    earlyEdit.recentContent[0] = 'z';
    assert(fingerprint.compute(request, longContext) == fingerprint.compute(request, earlyEdit));

    auto manyCharacters = base;
    manyCharacters.characters = {"A", "B", "C", "D", "E", "F"};
    auto sixthChanged = manyCharacters;
    sixthChanged.characters[5] = "G";
    assert(fingerprint.compute(request, manyCharacters) == fingerprint.compute(request, sixthChanged));
    std::cout << "[OK] ResponseFingerprint context sensitivity test\n";
}

void utf8ExcerptTestResponseFingerprint() {
    // "привет" занимает 12 байт, по 2 байта на символ
    const std::string word = "\xD0\xBF\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82";
    assert(ContextFingerprint::utf8Tail(word, 5) == "\xD0\xB5\xD1\x82");
    assert(ContextFingerprint::utf8Head(word, 5) == "\xD0\xBF\xD1\x80");
    assert(ContextFingerprint::utf8Tail(word, 100) == word);
    assert(ContextFingerprint::utf8Head("abc", 2) == "ab");

    ContextFingerprint fingerprint;
    PromptContext context;
    context.recentContent = std::string(600, 'a') + word;
    auto canonical = fingerprint.canonicalize(makeRequest(), context);
    const auto tail = canonical["project_context"]["recent_content"].get<std::string>();
    assert(tail.size() <= 500);
    assert(tail.substr(tail.size() - word.size()) == word);
    assert(!canonical["project_context"].contains("genre"));
    std::cout << "[OK] ResponseFingerprint UTF-8 excerpt test\n";
}

int main() {
    smokeTestResponseFingerprint();
    contextSensitivityTestResponseFingerprint();
    utf8ExcerptTestResponseFingerprint();
    std::cout << "All ResponseFingerprint tests passed!\n";
    return 0;
}
