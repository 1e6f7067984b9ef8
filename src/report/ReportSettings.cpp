// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ReportSettings.h"
#include <clarisma/io/File.h>
#include "util/JsonParser.h"

const char* const ReportSettings::KEY_NAMES[KEY_COUNT] =
{
    "header_1",
    "header_2",
    "title",
    "date_prefix",
    "reference_number",
    "description",
    "address",
    "postal_code",
    "contact_phone",
    "contact_fax",
    "contact_email",
    "sign1",
    "sign1_name",
    "sign2",
    "sign2_name",
};

const char* const ReportSettings::DEFAULTS[KEY_COUNT] =
{
    "SIGLA - DIRETORIA / SIGLA - DIVISÃO",
    "UNICAMP - UNIVERSIDADE ESTADUAL DE CAMPINAS",
    "RELATÓRIO DE XXXX - SERVIÇOS DE XXXX",
    "DATA DO RELATÓRIO:",
    "CONTRATO Nº: XXX/20XX - PRESTADORA LTDA",
    "Descrição: Vistoria de campo realizada pelos técnicos da SIGLA/SIGLA,",
    "Rua XX de XX, número - Cidade Universitária Zeferino Vaz - Campinas - SP",
    "CEP: XXXXX-XXX",
    "Tel: (19) XXXX-XXXX",
    "Fax: (19) XXXX-XXXX",
    "XXXXXXXXXX@unicamp.br",
    "PREPOSTO CONTRATANTE",
    "sign1_name",
    "PREPOSTO CONTRATADA",
    "sign2_name",
};

namespace
{
    class SettingsParser : public JsonParser
    {
    public:
        SettingsParser(const char* s, ReportSettings& settings) :
            JsonParser(s),
            settings_(settings)
        {
        }

        void parse()
        {
            expectObjectStart();
            members([this](const std::string& key)
            {
                int k = ReportSettings::keyOf(key);
                if (k < 0)
                {
                    skipValue(0);
                    return;
                }
                settings_.set(static_cast<ReportSettings::Key>(k), scalarAsString());
            });
        }

    private:
        ReportSettings& settings_;
    };
}

ReportSettings::ReportSettings()
{
    for (int i = 0; i < KEY_COUNT; i++) values_[i] = DEFAULTS[i];
}

int ReportSettings::keyOf(std::string_view name)
{
    for (int i = 0; i < KEY_COUNT; i++)
    {
        if (name == KEY_NAMES[i]) return i;
    }
    return -1;
}

std::vector<std::string> ReportSettings::footerLines() const
{
    std::vector<std::string> lines;
    lines.push_back(values_[ADDRESS]);
    lines.push_back(values_[POSTAL_CODE] + " - " + values_[CONTACT_PHONE] +
        " - " + values_[CONTACT_FAX]);
    lines.push_back(values_[CONTACT_EMAIL]);
    return lines;
}

std::string ReportSettings::locationDate(std::string_view reportDate) const
{
    std::string s = values_[ADDRESS];
    s += ", ";
    s += reportDate;
    return s;
}

void ReportSettings::load(const char* fileName)
{
    std::string content = File::readString(fileName);
    loadFromString(content.c_str());
}

void ReportSettings::loadFromString(const char* json)
{
    SettingsParser parser(json, *this);
    parser.parse();
}
