#include "ollama/chat.hpp"
#include "ollama/chat_stream.hpp"
#include "ollama/client.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

namespace {

ollama::ToolDefinition current_time_tool()
{
  ollama::ToolDefinition tool;
  tool.function.name = "current_time";
  tool.function.description = "Returns the current local time of the machine running this demo.";
  tool.function.parameters = {{"type", "object"}, {"properties", nlohmann::json::object()}};
  return tool;
}

std::string run_tool(const ollama::ReassembledToolCall& call)
{
  if (call.name == "current_time")
  {
    std::time_t now = std::time(nullptr);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
    return buffer;
  }
  return "unknown tool: " + call.name;
}

}  // namespace

int main(int argc, char** argv)
{
  const std::string model = argc > 1 ? argv[1] : "qwen3";

  try
  {
    ollama::OllamaClient client;

    std::cout << "Streaming chat with " << model << " at " << client.options().host << "\n"
              << "Type 'exit' or 'quit' to stop.\n";

    std::vector<ollama::ChatMessage> history;

    for (;;)
    {
      std::cout << "\nYou> " << std::flush;
      std::string user_input;

      if (!std::getline(std::cin, user_input))
      {
        std::cout << "\nEnd of input, exiting.\n";
        break;
      }

      if (user_input == "exit" || user_input == "quit")
      {
        std::cout << "Goodbye!\n";
        break;
      }

      if (user_input.empty())
      {
        continue;
      }

      ollama::ChatMessage user;
      user.role = "user";
      user.content = user_input;
      history.push_back(user);

      // A reply may ask for tools; answer them and let the model continue.
      bool awaiting_reply = true;
      while (awaiting_reply)
      {
        ollama::ChatRequest request;
        request.model = model;
        request.messages = history;
        request.tools.push_back(current_time_tool());

        std::cout << "Assistant> " << std::flush;

        auto events = client.chat().events(request);
        bool thinking_shown = false;
        for (auto& event : events)
        {
          switch (event.type)
          {
            case ollama::ChatStreamEvent::Type::Thinking:
              if (!thinking_shown)
              {
                std::cout << "[thinking] ";
                thinking_shown = true;
              }
              std::cout << event.text << std::flush;
              break;
            case ollama::ChatStreamEvent::Type::Content:
              std::cout << event.text << std::flush;
              break;
            case ollama::ChatStreamEvent::Type::ToolCall:
              std::cout << "\n[tool call] " << event.tool_call->name << " "
                        << event.tool_call->arguments_json.dump() << std::endl;
              break;
            case ollama::ChatStreamEvent::Type::ToolCallError:
              std::cerr << "\n[tool call error] " << event.tool_call_error->what() << std::endl;
              break;
            case ollama::ChatStreamEvent::Type::Done:
              break;
          }
        }
        std::cout << std::endl;

        ollama::ChatMessage assistant;
        assistant.role = "assistant";
        assistant.content = events.content();
        for (const auto& call : events.tool_calls())
        {
          assistant.tool_calls.push_back(call.to_tool_call());
        }
        history.push_back(assistant);

        awaiting_reply = !events.tool_calls().empty();
        for (const auto& call : events.tool_calls())
        {
          history.push_back(ollama::make_tool_result_message(call.name, run_tool(call)));
        }
      }
    }
  }
  catch (const ollama::APIError& error)
  {
    std::cerr << "Ollama API error (" << error.status_code() << "): " << error.what() << std::endl;
    return 1;
  }
  catch (const ollama::OllamaError& error)
  {
    std::cerr << "Ollama error: " << error.what() << std::endl;
    return 1;
  }
  catch (const std::exception& error)
  {
    std::cerr << "Unexpected error: " << error.what() << std::endl;
    return 1;
  }

  return 0;
}
