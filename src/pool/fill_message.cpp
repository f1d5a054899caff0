#include "ph_base.hpp"
#include "pool/fill_message.hpp"

namespace poolhub::pool
{

std::pair<std::string, std::string> split_completion_start(std::string_view prefix)
{
    if (prefix.size() <= COMPLETION_START_LENGTH)
    {
        return {std::string{}, std::string(prefix)};
    }
    // Search forward from the ideal cut so the head ends on a complete word and the
    // completion start stays short enough to be echoed reliably.
    const size_t ideal_cut = prefix.size() - COMPLETION_START_LENGTH;
    const size_t search_end = std::min(prefix.size(), ideal_cut + COMPLETION_START_LENGTH);
    size_t cut = ideal_cut;
    for (size_t i = ideal_cut; i < search_end; ++i)
    {
        if (prefix[i] == ' ' || prefix[i] == '\n')
        {
            cut = i;
            break;
        }
    }
    return {std::string(prefix.substr(0, cut)), std::string(prefix.substr(cut))};
}

FillMessage build_fill_message(std::string_view prefix, std::string_view suffix)
{
    auto [head, completion_start] = split_completion_start(prefix);
    const bool has_suffix = !format_tools::trim_whitespace(suffix).empty();

    FillMessage out;
    out.message = fmt::format("<current_text>{}>>>CURSOR<<<{}</current_text>\n"
                              "<completion_start>{}</completion_start>",
                              head, has_suffix ? suffix : std::string_view{}, completion_start);
    out.completion_start = std::move(completion_start);
    return out;
}

std::string extract_output(std::string_view raw)
{
    static constexpr std::string_view kOpen = "<output>";
    static constexpr std::string_view kClose = "</output>";
    const size_t open = raw.find(kOpen);
    const size_t close = raw.rfind(kClose);
    if (open == std::string_view::npos || close == std::string_view::npos || close <= open)
    {
        return std::string(raw);
    }
    const size_t body = open + kOpen.size();
    return std::string(raw.substr(body, close > body ? close - body : 0));
}

std::optional<std::string> strip_completion_start(std::string_view output,
                                                  std::string_view completion_start)
{
    if (completion_start.empty())
    {
        return std::string(output);
    }
    if (output.substr(0, completion_start.size()) == completion_start)
    {
        return std::string(output.substr(completion_start.size()));
    }
    return std::nullopt;
}

const std::string &default_completion_system_prompt()
{
    static const std::string prompt = R"(You are an autocomplete tool.

You receive:
1. <current_text> with a >>>CURSOR<<< marker showing the insertion point
2. <completion_start> containing text that your output MUST begin with

Generate <output> containing text that:
- Starts EXACTLY with the text in <completion_start> (character for character)
- Continues naturally from there
- Fits the context, voice and format of the document

Rules:
- If the text is already complete, output just the <completion_start> text unchanged
- If there is text after >>>CURSOR<<<, output just enough to bridge the gap to it
- If there is no text after >>>CURSOR<<<, continue for a sentence or two (or a few lines of code)
- Focus on what belongs at the cursor and ignore problems elsewhere in the text
- Preserve whitespace exactly; <completion_start> may contain spaces or newlines
- No code fences, commentary or meta-text

Example:
<current_text>Steps to deploy:
1. Build the project
2. Run the tests
>>>CURSOR<<<
4. Verify the deployment</current_text>
<completion_start>3. </completion_start>
<output>3. Push to production</output>

Example:
<current_text>function add(a, b>>>CURSOR<<<
}</current_text>
<completion_start>) {</completion_start>
<output>) {
  return a + b;</output>

Now output only <output> tags:
)";
    return prompt;
}

} // namespace poolhub::pool
