/**
 * @file sacct_parser.cpp
 */
#include "memescalate/scheduler/sacct_parser.hpp"
#include "memescalate/common/text_utils.hpp"

#include <charconv>
#include <sstream>

namespace memescalate
{

namespace
{

std::vector<std::string> split_fields(const std::string& line)
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (true)
    {
        size_t end = line.find('|', start);
        fields.push_back(line.substr(start, end == std::string::npos ? std::string::npos
                                                                     : end - start));
        if (end == std::string::npos)
        {
            break;
        }
        start = end + 1;
    }
    return fields;
}

std::string first_word(const std::string& text)
{
    std::istringstream in(text);
    std::string word;
    in >> word;
    return word;
}

bool parse_int(const std::string& text, int& value)
{
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    return !text.empty() && ec == std::errc{} && ptr == end;
}

} // namespace

std::optional<TaskIdx> parse_task_id(const std::string& job_field)
{
    auto underscore = job_field.find('_');
    if (underscore == std::string::npos)
    {
        return TaskIdx{0};
    }
    const std::string suffix = job_field.substr(underscore + 1);
    TaskIdx value = 0;
    const char* end = suffix.data() + suffix.size();
    auto [ptr, ec] = std::from_chars(suffix.data(), end, value);
    if (suffix.empty() || ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

std::vector<TaskAccounting> parse_sacct_output(const std::string& output)
{
    std::vector<TaskAccounting> tasks;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (trim(line).empty())
        {
            continue;
        }

        std::vector<std::string> fields = split_fields(line);
        if (fields.size() < 3)
        {
            continue;
        }
        fields.resize(10);

        TaskAccounting task;
        task.job_id = trim(fields[0]);
        auto task_id = parse_task_id(task.job_id);
        if (!task_id)
        {
            continue;
        }
        task.task_id = *task_id;
        task.state = first_word(fields[1]);
        task.exit_code = trim(fields[2]);

        auto colon = task.exit_code.find(':');
        if (colon != std::string::npos)
        {
            int return_code = 0;
            int signal = 0;
            if (parse_int(task.exit_code.substr(0, colon), return_code) &&
                parse_int(task.exit_code.substr(colon + 1), signal))
            {
                task.return_code = return_code;
                task.signal = signal;
            }
        }

        task.max_rss = fields[3];
        task.elapsed = fields[4];
        task.timelimit = fields[5];
        task.node = fields[6];
        task.submit_time = fields[7];
        task.start_time = fields[8];
        task.end_time = fields[9];
        tasks.push_back(std::move(task));
    }
    return tasks;
}

std::optional<std::string> parse_squeue_state(const std::string& output)
{
    std::string word = first_word(output);
    if (word.empty())
    {
        return std::nullopt;
    }
    return word;
}

} // namespace memescalate
