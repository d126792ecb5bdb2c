#include <string>
#ifndef LOGGER_HPP
#define LOGGER_HPP

class Logger {
    public:
        Logger(std::string component);
        void logInfo(std::string entry); //Log to file only
        void logWarning(std::string entry); //Log to file and stderr
        void logError(std::string entry); //Log to file and stderr
        void logTraining(std::string text, bool safe, double loss); //Log a training call and its loss
        void logDecision(std::string text, bool safe, double score); //Log an allow/ban decision

        static void setLogFile(std::string path); //Shared by all Logger instances
        static std::string getLogFile();
    private:
        std::string component;
        const std::string getTime();
        std::string format(const std::string& level, const std::string& entry);
        void logToFile(std::string entry);
};

#endif // LOGGER_HPP
