#include <iostream>
#include <string>
#include <vector>
#include "idcard/idcard.h"

// Example: validating and decoding identity card numbers

int main(int argc, char** argv) {
    std::cout << "idcard v" << idcard::VERSION << std::endl;
    std::cout << "========================================" << std::endl;

    idcard::IdentityValidator validator;

    // Numbers from the command line, or a built-in sample set
    std::vector<std::string> numbers;
    for (int i = 1; i < argc; i++) {
        numbers.push_back(argv[i]);
    }
    if (numbers.empty()) {
        numbers = {
            "632123820927051",
            "21021119810503545X",
            "G123456(A)",
            "1123456(A)",
            "A123456789",
            "230127197908177457",
        };
    }

    for (const auto& number : numbers) {
        auto result = validator.validate(number);

        std::cout << "\n" << number << std::endl;
        std::cout << "  Jurisdiction: " << idcard::jurisdictionName(result.jurisdiction) << std::endl;
        if (!result.valid) {
            std::cout << "  [INVALID] " << idcard::validationErrorName(result.code)
                      << ": " << result.error << std::endl;
            continue;
        }
        std::cout << "  [VALID]" << std::endl;

        idcard::Identity id = validator.decode(number);
        if (!id.isValid()) {
            continue;
        }

        const std::string* region = id.region();
        int age = 0;
        std::cout << "  Number: " << id.number() << std::endl;
        std::cout << "  Born: " << id.birthDateString() << std::endl;
        if (id.age(age)) {
            std::cout << "  Age: " << age << std::endl;
        }
        std::cout << "  Gender: " << (id.gender() == idcard::Gender::MALE ? "male" : "female") << std::endl;
        std::cout << "  Province: " << (id.province() ? id.province() : "-") << std::endl;
        std::cout << "  Region: " << (region ? *region : "-") << std::endl;
        std::cout << "  Sign: " << id.constellation() << std::endl;
        std::cout << "  Year: " << id.chineseEra() << " (" << id.chineseZodiac() << ")" << std::endl;
    }

    // Synthetic number for a female born in Hangzhou in the 1990s
    idcard::FakeOptions options;
    options.withRegion("3301").withMinYear(1990).withMaxYear(1999).withGender(idcard::Gender::FEMALE);

    auto generated = idcard::fake::randWithOptions(options);
    std::cout << "\nGenerated: ";
    if (generated.success) {
        std::cout << generated.number << std::endl;
    } else {
        std::cout << "[FAILED] " << generated.error << std::endl;
    }

    return 0;
}
