#include "pnn/adapters/uk_ocds_xml_adapter.h"

#include "pnn/classify/notice_classifier.h"
#include "pnn/extract/join.h"
#include "pnn/extract/xml_accessors.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pnn::adapters {

namespace {

using extract::child_text;
using record::FieldValue;

constexpr std::string_view kFormYearSuffix = "_2023";

struct PartyView {
  std::vector<std::string> roles;
  FieldValue name;
  FieldValue country;
  FieldValue town;
  FieldValue postcode;
  FieldValue region;
  FieldValue url;

  [[nodiscard]] bool has_role(const std::string_view role) const {
    for (const auto& r : roles) {
      if (r == role) {
        return true;
      }
    }
    return false;
  }
};

PartyView read_party(const pugi::xml_node& party) {
  PartyView view;
  for (const pugi::xml_node& role : party.children("roles")) {
    if (auto value = extract::text(role)) {
      view.roles.push_back(std::move(*value));
    }
  }
  view.name = child_text(party, "name");

  const pugi::xml_node address = party.child("address");
  view.region = child_text(address, "region");
  view.country = child_text(address, "country");
  view.town = child_text(address, "locality");
  view.postcode = child_text(address, "postalCode");

  view.url = child_text(party.child("details"), "url");
  return view;
}

// Supplier names held at award level: the award's own suppliers list and any award-level
// party carrying the supplier role
void collect_award_suppliers(const pugi::xml_node& award, std::vector<FieldValue>& names) {
  for (const pugi::xml_node& supplier : award.children("suppliers")) {
    names.push_back(child_text(supplier, "name"));
  }
  for (const pugi::xml_node& party : award.children("parties")) {
    const PartyView view = read_party(party);
    if (view.has_role("supplier")) {
      names.push_back(view.name);
    }
  }
}

}  // namespace

UkOcdsXmlAdapter::UkOcdsXmlAdapter(std::string form_tag) : form_tag_(std::move(form_tag)) {}

std::string UkOcdsXmlAdapter::short_form() const {
  std::string result = form_tag_;
  const auto pos = result.find(kFormYearSuffix);
  if (pos != std::string::npos) {
    result.erase(pos, kFormYearSuffix.size());
  }
  return result;
}

record::NoticeRecord UkOcdsXmlAdapter::extract(const pugi::xml_node& root) const {
  const pugi::xml_node notice_data = root.child("NOTICE_DATA");
  const FieldValue no_doc_ext = child_text(notice_data, "NO_DOC_EXT");
  const FieldValue notice_doc_id = child_text(notice_data, "DOC_ID");
  const FieldValue notice_url = child_text(notice_data, "URI_DOC");
  const FieldValue published = child_text(notice_data, "PUBLISHED");

  record::NoticeRecord rec;
  rec.set("schema_type", schema_type());
  rec.set("form_type", short_form());
  rec.set("td_document_type_code", short_form());

  // find_node only visits descendants, never root itself
  const pugi::xml_node form = root.find_node(
      [this](const pugi::xml_node& n) { return form_tag_ == n.name(); });
  if (!form) {
    rec.set("notice_type_group",
            classify::notice_type_group_to_string(classify::NoticeTypeGroup::kOther));
    rec.set("doc_id", notice_doc_id);
    rec.set("edition", std::nullopt);
    rec.set("no_doc_ojs", no_doc_ext);
    rec.set("notice_url", notice_url);
    rec.set("date_pub", published);
    return rec;
  }

  // Parties: first buyer wins, every supplier is kept
  std::optional<PartyView> buyer;
  std::vector<FieldValue> supplier_names;
  for (const pugi::xml_node& party : form.children("parties")) {
    PartyView view = read_party(party);
    if (view.has_role("supplier")) {
      supplier_names.push_back(view.name);
    }
    if (view.has_role("buyer") && !buyer.has_value()) {
      buyer = std::move(view);
    }
  }
  if (!buyer.has_value()) {
    buyer = PartyView{};
  }
  if (!buyer->name.has_value()) {
    buyer->name = child_text(form.child("buyer"), "name");
  }

  // Awards: CPV classifications, delivery regions, suppliers, procurement category
  std::vector<std::string> cpv_codes;
  std::vector<FieldValue> delivery_regions;
  FieldValue main_procurement_category;
  for (const pugi::xml_node& award : form.children("awards")) {
    for (const pugi::xml_node& item : award.children("items")) {
      for (const pugi::xml_node& classification : item.children("additionalClassifications")) {
        const FieldValue scheme = child_text(classification, "scheme");
        FieldValue id = child_text(classification, "id");
        if (scheme == "CPV" && id.has_value()) {
          cpv_codes.push_back(std::move(*id));
        }
      }
      for (const pugi::xml_node& address : item.children("deliveryAddresses")) {
        delivery_regions.push_back(child_text(address, "region"));
      }
    }
    collect_award_suppliers(award, supplier_names);
    if (!main_procurement_category.has_value()) {
      main_procurement_category = child_text(award, "mainProcurementCategory");
    }
  }

  FieldValue cpv_main_code;
  FieldValue additional_cpv_codes;
  if (!cpv_codes.empty()) {
    cpv_main_code = cpv_codes.front();
    const std::vector<FieldValue> rest(cpv_codes.begin() + 1, cpv_codes.end());
    additional_cpv_codes = extract::join_sorted_xml(rest);
  }

  std::vector<std::string> tags;
  for (const pugi::xml_node& tag : form.children("tag")) {
    if (auto value = extract::text(tag)) {
      tags.push_back(std::move(*value));
    }
  }
  const auto group = classify::classify_uk_form(form_tag_, tags);

  const pugi::xml_node tender = form.child("tender");
  const FieldValue title = child_text(tender, "title");

  rec.set("notice_type_group", classify::notice_type_group_to_string(group));

  rec.set("doc_id", notice_doc_id.has_value() ? notice_doc_id : child_text(form, "id"));
  rec.set("edition", std::nullopt);
  rec.set("no_doc_ojs", no_doc_ext);
  rec.set("notice_url", notice_url);

  rec.set("date_pub", published.has_value() ? published : child_text(form, "date"));
  rec.set("ds_date_dispatch", std::nullopt);
  rec.set("award_date", std::nullopt);

  rec.set("iso_country", buyer->country);
  rec.set("ti_country", std::nullopt);
  rec.set("ti_town", buyer->town);
  rec.set("ca_country_code", buyer->country);
  rec.set("ca_town", buyer->town);
  rec.set("ca_postcode", buyer->postcode);
  rec.set("ca_nuts_code", buyer->region);
  rec.set("perf_nuts_code", extract::join_sorted_xml(delivery_regions));
  rec.set("ca_ce_nuts_code", std::nullopt);

  rec.set("ca_name", buyer->name);
  rec.set("ca_email", std::nullopt);
  rec.set("ca_url", buyer->url);

  rec.set("original_cpv_code", cpv_main_code);
  rec.set("cpv_main_code", cpv_main_code);
  rec.set("additional_cpv_codes", additional_cpv_codes);

  rec.set("ti_text", title);
  rec.set("obj_title", title);
  rec.set("short_descr", child_text(tender, "description"));
  rec.set("type_contract_ctype", classify::infer_contract_type(main_procurement_category));

  for (const char* column :
       {"val_total", "val_total_currency", "est_total_val", "est_total_val_currency",
        "proc_total_val", "proc_total_val_currency", "aw_val_total", "aw_val_currency",
        "nb_tenders", "nc_contract_nature_code", "pr_proc_code", "ac_award_crit_code",
        "ma_main_activities_code", "rp_regulation_code"}) {
    rec.set(column, std::nullopt);
  }

  rec.set("contractor_names", extract::join_sorted_xml(supplier_names));

  return rec;
}

}  // namespace pnn::adapters
