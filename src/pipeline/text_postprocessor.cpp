#include "pipeline/text_postprocessor.h"
#include "common/logger.hpp"
#include <cctype>
#include <sstream>

namespace multiocr {

namespace {

CorrectionRule literal(const std::string& name, const std::string& pattern, const std::string& replacement,
                       std::regex::flag_type flags = std::regex::ECMAScript) {
    return CorrectionRule{name, std::regex(pattern, flags),
                          [replacement](const std::smatch&) { return replacement; }};
}

// Replacement keeps capture group 1 and appends a fixed suffix
CorrectionRule keepPrefix(const std::string& name, const std::string& pattern, const std::string& suffix) {
    return CorrectionRule{name, std::regex(pattern),
                          [suffix](const std::smatch& m) { return m[1].str() + suffix; }};
}

// Replacement is a fixed prefix followed by capture group 1
CorrectionRule keepSuffix(const std::string& name, const std::string& pattern, const std::string& prefix) {
    return CorrectionRule{name, std::regex(pattern),
                          [prefix](const std::smatch& m) { return prefix + m[1].str(); }};
}

const char* const kCommonWords[] = {
    "the", "a", "an", "and", "or", "but", "in", "on", "at", "to", "for", "of", "with", "by", "from",
    "up", "about", "into", "over", "after", "is", "are", "was", "were", "be", "been", "being", "have",
    "has", "had", "do", "does", "did", "will", "would", "could", "should", "may", "might", "must",
    "i", "you", "he", "she", "it", "we", "they", "me", "him", "her", "us", "them", "my", "your", "his",
    "its", "our", "their", "this", "that", "these", "those", "here", "there", "where", "when", "why",
    "how", "what", "who", "which", "whose",
    "order", "invoice", "receipt", "payment", "total", "subtotal", "tax", "discount", "price", "cost",
    "amount", "quantity", "qty", "each", "item", "product", "customer", "client", "vendor", "supplier",
    "company", "business", "store", "shop", "address", "phone", "email", "date", "time", "name",
    "first", "last", "middle", "number", "account", "reference", "description", "details", "notes",
    "comments",
    "zero", "one", "two", "three", "four", "five", "six", "seven", "eight", "nine", "ten",
    "eleven", "twelve", "thirteen", "fourteen", "fifteen", "sixteen", "seventeen", "eighteen",
    "nineteen", "twenty", "thirty", "forty", "fifty", "sixty", "seventy", "eighty", "ninety",
    "hundred", "thousand", "million",
    "new", "old", "good", "bad", "big", "small", "large", "little", "long", "short", "high", "low",
    "right", "left", "next", "second", "get", "go", "come", "see", "look", "use", "make", "take",
    "give", "put", "say", "tell", "know", "think", "feel", "find", "work", "call", "try"
};

const char* const kDomainTerms[] = {
    "billing", "remittance", "statement", "balance", "credit", "debit", "refund", "adjustment",
    "vat", "gst", "hst", "pst", "surcharge", "fee", "shipping", "handling", "freight",
    "sku", "upc", "barcode", "model", "serial", "lot", "batch", "expiry", "warranty", "brand",
    "manufacturer", "weight", "volume", "dimensions", "color", "size", "grade", "quality",
    "purchase", "quote", "estimate", "proposal", "contract", "agreement", "terms", "conditions",
    "distributor", "wholesaler", "retailer", "buyer", "seller", "delivery", "pickup", "shipment",
    "tracking", "logistics", "warehouse", "inventory", "stock",
    "street", "avenue", "road", "boulevard", "suite", "apartment", "unit", "floor", "building",
    "city", "state", "province", "country", "postal", "zip", "code", "fax", "website",
    "piece", "dozen", "pair", "set", "box", "case", "pallet", "pound", "kilogram", "gram", "ounce",
    "liter", "gallon", "quart", "pint", "cup", "meter", "foot", "inch", "yard", "centimeter",
    "millimeter"
};

} // namespace

RuleBasedPostProcessor::RuleBasedPostProcessor() {
    // OCR confusions
    rules_.push_back(literal("zero_to_letter_o", R"(\b0(?=[A-Za-z]))", "O"));
    rules_.push_back(keepPrefix("trailing_zero_to_o", R"(([A-Za-z])0\b)", "o"));
    rules_.push_back(literal("l_to_digit_1", R"(\bl(?=\d))", "1"));
    rules_.push_back(keepPrefix("trailing_l_to_digit_1", R"((\d)l\b)", "1"));
    rules_.push_back(literal("s_to_digit_5", R"(\bS(?=\d))", "5"));
    rules_.push_back(literal("g_to_digit_6", R"(\bG(?=\d))", "6"));
    rules_.push_back(literal("b_to_digit_8", R"(\bB(?=\d))", "8"));
    rules_.push_back(literal("rn_to_m", R"(\brn)", "m"));
    rules_.push_back(literal("vv_to_w", R"(\bvv)", "w"));

    // Labels and currency
    rules_.push_back(literal("total_label", R"(\bTotal\s+:)", "Total:", std::regex::ECMAScript | std::regex::icase));
    rules_.push_back(literal("subtotal_label", R"(\bSubtotal\s+:)", "Subtotal:", std::regex::ECMAScript | std::regex::icase));
    rules_.push_back(literal("tax_label", R"(\bTax\s+:)", "Tax:", std::regex::ECMAScript | std::regex::icase));
    rules_.push_back(keepSuffix("currency_spacing", R"(\$[ \t]+(\d))", "$"));

    for (const char* word : kCommonWords) vocabulary_.insert(word);
    for (const char* word : kDomainTerms) vocabulary_.insert(word);
}

PostProcessResult RuleBasedPostProcessor::process(const std::string& text, const ProcessingOptions& options) {
    PostProcessResult result;
    std::string current = text;
    for (const auto& rule : rules_) {
        current = applyRule(rule, current, result.corrections);
    }
    result.correctedText = normalizeWhitespace(current);
    result.semanticConfidence = semanticConfidence(result.correctedText);

    LOG_DEBUG("[{}] post-processing applied {} corrections, semantic confidence {:.3f}",
              options.correlationId, result.corrections.size(), result.semanticConfidence);
    return result;
}

std::string RuleBasedPostProcessor::applyRule(const CorrectionRule& rule, const std::string& text,
                                              std::vector<TextCorrection>& corrections) {
    std::string out;
    out.reserve(text.size());

    auto last = text.cbegin();
    for (std::sregex_iterator it(text.begin(), text.end(), rule.pattern), end; it != end; ++it) {
        const std::smatch& match = *it;
        std::string replacement = rule.rewrite(match);
        out.append(last, match[0].first);
        out += replacement;
        last = match[0].second;

        if (replacement != match.str()) {
            TextCorrection correction;
            correction.original = match.str();
            correction.corrected = replacement;
            correction.rule = rule.name;
            correction.position = static_cast<size_t>(match.position(0));
            corrections.push_back(std::move(correction));
        }
    }
    out.append(last, text.cend());
    return out;
}

std::string RuleBasedPostProcessor::normalizeWhitespace(const std::string& text) {
    // Collapse blanks inside a line, trim each line, drop empty lines
    std::istringstream lines(text);
    std::string line;
    std::string out;
    while (std::getline(lines, line)) {
        std::string collapsed;
        bool pendingSpace = false;
        for (char c : line) {
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
                pendingSpace = !collapsed.empty();
                continue;
            }
            if (pendingSpace) collapsed += ' ';
            pendingSpace = false;
            collapsed += c;
        }
        if (collapsed.empty()) continue;
        if (!out.empty()) out += '\n';
        out += collapsed;
    }
    return out;
}

double RuleBasedPostProcessor::semanticConfidence(const std::string& text) const {
    std::istringstream tokens(text);
    std::string token;
    size_t total = 0;
    size_t known = 0;
    while (tokens >> token) {
        ++total;
        std::string clean;
        for (char c : token) {
            unsigned char u = static_cast<unsigned char>(c);
            if (std::isalnum(u) || c == '_') {
                clean += static_cast<char>(std::tolower(u));
            }
        }
        if (vocabulary_.count(clean)) ++known;
    }
    return total > 0 ? static_cast<double>(known) / static_cast<double>(total) : 0.0;
}

} // namespace multiocr
