#include "ollama/client.hpp"
#include "ollama/models.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <utility>

int main(int argc, char** argv)
{
  if (argc < 2)
  {
    std::cerr << "usage: pull_demo <model>\n";
    return 1;
  }

  try
  {
    ollama::ClientOptions options;
    options.log_level = ollama::LogLevel::Warn;
    options.logger = [](ollama::LogLevel level, const std::string& message, const nlohmann::json& details)
    {
      std::cerr << "[" << ollama::to_string(level) << "] " << message << " " << details.dump() << std::endl;
    };
    ollama::OllamaClient client(std::move(options));

    ollama::PullRequest request;
    request.model = argv[1];

    std::string last_status;
    bool succeeded = false;
    for (auto& event : client.models().pull(request))
    {
      const auto& progress = event.payload;
      if (progress.total && progress.completed && *progress.total > 0)
      {
        const double percent = 100.0 * static_cast<double>(*progress.completed) / static_cast<double>(*progress.total);
        std::cout << "\r" << progress.status << " " << std::fixed << std::setprecision(1) << percent << "%"
                  << std::flush;
      }
      else if (progress.status != last_status)
      {
        std::cout << "\n" << progress.status << std::flush;
      }
      last_status = progress.status;
      succeeded = succeeded || event.done;
    }
    std::cout << std::endl;

    if (!succeeded)
    {
      std::cerr << "Pull ended before the server reported success.\n";
      return 1;
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

  return 0;
}
