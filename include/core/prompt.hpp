#ifndef APRELAY_CORE_PROMPT_HPP
#define APRELAY_CORE_PROMPT_HPP

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace aprelay
{
    namespace core
    {

        /**
         * Raised when the operator's input ends before all answers were given
         */
        class InputClosed : public std::runtime_error
        {
        public:
            InputClosed() : std::runtime_error("input closed") {}
        };

        /**
         * Line-oriented question and answer on a pair of streams
         */
        class Prompter
        {
        public:
            Prompter(std::istream &in, std::ostream &out);

            // Shows "question [default]: "; an empty answer selects the default
            std::string ask(const std::string &question, const std::string &default_value);

            // Repeats the question until a non-empty answer is given
            std::string ask_required(const std::string &question);

            void say(const std::string &message);

        private:
            std::string read_answer();

            std::istream &in_;
            std::ostream &out_;
        };

    } // namespace core
} // namespace aprelay

#endif // APRELAY_CORE_PROMPT_HPP
