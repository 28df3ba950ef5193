#include "core/prompt.hpp"

namespace aprelay
{
    namespace core
    {

        namespace
        {
            std::string trim(const std::string &text)
            {
                const char *whitespace = " \t\r\n";
                auto begin = text.find_first_not_of(whitespace);
                if (begin == std::string::npos)
                {
                    return "";
                }
                auto end = text.find_last_not_of(whitespace);
                return text.substr(begin, end - begin + 1);
            }
        }

        Prompter::Prompter(std::istream &in, std::ostream &out)
            : in_(in), out_(out)
        {
        }

        std::string Prompter::ask(const std::string &question, const std::string &default_value)
        {
            out_ << question;
            if (!default_value.empty())
            {
                out_ << " [" << default_value << "]";
            }
            out_ << ": " << std::flush;

            std::string answer = read_answer();
            return answer.empty() ? default_value : answer;
        }

        std::string Prompter::ask_required(const std::string &question)
        {
            while (true)
            {
                out_ << question << ": " << std::flush;
                std::string answer = read_answer();
                if (!answer.empty())
                {
                    return answer;
                }
                out_ << "A value is required." << std::endl;
            }
        }

        void Prompter::say(const std::string &message)
        {
            out_ << message << std::endl;
        }

        std::string Prompter::read_answer()
        {
            std::string line;
            if (!std::getline(in_, line))
            {
                out_ << std::endl;
                throw InputClosed();
            }
            return trim(line);
        }

    } // namespace core
} // namespace aprelay
